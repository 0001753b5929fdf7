//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/file_tftp.h>
#include <hal_posix/posix_utils.h>
#include <hal_posix/udp_socket.h>
#include <pxeboot/log.h>

static const char PATH_SEP = '/';

// Shortcuts for commonly used names.
using pxeboot::io::FileReader;
using pxeboot::udp::SocketPosix;
using pxeboot::udp::TftpServerPosix;

// Append a trailing separator if required.
static std::string folder_prefix(const char* folder)
{
    std::string tmp(folder ? folder : "");
    if (tmp.empty() || tmp.back() != PATH_SEP) tmp.push_back(PATH_SEP);
    return tmp;
}

TftpServerPosix::TftpServerPosix(
    pxeboot::udp::Socket* sock,
    const char* root_folder)
    : pxeboot::udp::TftpServerCore(sock)
    , m_root_folder(folder_prefix(root_folder))
{
    // No other initialization required.
}

pxeboot::io::Readable* TftpServerPosix::read(const char* path)
{
    // Only regular files are served; folders count as "not found".
    std::string full_path = m_root_folder + path;
    if (!pxeboot::util::is_file(full_path.c_str())) return 0;

    FileReader* file = new FileReader();
    if (!file->open(full_path.c_str())) {
        delete file;
        return 0;
    }

    Log(log::DEBUG, "TFTP", "Reading ").write(full_path.c_str())
        .write(", length").write10(file->remaining());
    return file;
}

pxeboot::udp::Socket* TftpServerPosix::open_socket()
{
    SocketPosix* sock = new SocketPosix();
    if (!sock->bind(pxeboot::udp::PORT_NONE)) {
        delete sock;
        return 0;
    }
    return sock;
}
