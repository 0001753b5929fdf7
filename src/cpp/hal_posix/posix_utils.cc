//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <hal_posix/posix_utils.h>
#include <pxeboot/eth_header.h>
#include <pxeboot/io_readable.h>
#include <pxeboot/ip_core.h>
#include <pxeboot/utils.h>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <sys/stat.h>   // For mkdir(), stat()
#include <unistd.h>     // For usleep()

using pxeboot::io::Readable;
using pxeboot::log::ToConsole;
using pxeboot::util::PosixTimer;
using pxeboot::util::write_be_u32;

std::string pxeboot::io::read_str(Readable* src)
{
    std::string tmp;
    while (src->get_read_ready())
        tmp.push_back((char)src->read_u8());
    src->read_finalize();
    return tmp;
}

PosixTimer::PosixTimer()
    : m_tref(now_msec())
{
    // Nothing else to initialize.
}

u64 PosixTimer::now_msec() const
{
    struct timespec tv;
    int errcode = clock_gettime(CLOCK_MONOTONIC, &tv);
    if (errcode) {
        // Fallback to clock() function, usually millisecond resolution.
        return u64(clock()) * 1000 / CLOCKS_PER_SEC;
    } else {
        return u64(tv.tv_sec) * 1000 + u64(tv.tv_nsec / 1000000);
    }
}

void pxeboot::util::sleep_msec(unsigned msec)
{
    usleep(msec * 1000);
}

bool pxeboot::util::is_folder(const char* path)
{
    struct stat info;
    if (!path || stat(path, &info)) return false;
    return S_ISDIR(info.st_mode);
}

bool pxeboot::util::is_file(const char* path)
{
    struct stat info;
    if (!path || stat(path, &info)) return false;
    return S_ISREG(info.st_mode);
}

bool pxeboot::util::make_folder(const char* path)
{
    if (!path || !*path) return false;
    if (is_folder(path)) return true;

    // Create each parent in turn, then the folder itself.
    std::string partial(path);
    for (size_t a = 1 ; a <= partial.size() ; ++a) {
        if (a < partial.size() && partial[a] != '/') continue;
        std::string prefix = partial.substr(0, a);
        if (mkdir(prefix.c_str(), 0755) && errno != EEXIST) {
            Log(pxeboot::log::ERROR, "Unable to create folder", prefix.c_str());
            return false;
        }
    }
    return is_folder(path);
}

ToConsole::ToConsole(s8 threshold)
    : m_threshold(threshold)
    , m_last_msg()
    , m_timer()
{
    // Nothing else to initialize.
}

bool ToConsole::contains(const char* msg) const
{
    return (m_last_msg.find(msg) != std::string::npos);
}

void ToConsole::suppress(const char* msg)
{
    if (msg) {
        m_suppress.push_back(std::string(msg));
    } else {
        m_suppress.clear();
    }
}

void ToConsole::log_event(s8 priority, unsigned nbytes, const char* msg)
{
    // Always store the most recent log-message.
    m_last_msg = std::string(msg, msg+nbytes);

    // Don't display anything below designated priority threshold.
    if (priority < m_threshold) return;

    // Don't display the message if it matches any saved filter.
    for (auto filter = m_suppress.begin() ; filter != m_suppress.end() ; ++filter) {
        if (m_last_msg.find(*filter) != std::string::npos) return;
    }

    // Timestamp = Seconds since creation of this object.
    u64 now = m_timer.elapsed_msec();
    unsigned sec = unsigned(now / 1000), msec = unsigned(now % 1000);

    // Print human-readable message to either STDERR or STDOUT.
    if (priority >= pxeboot::log::ERROR) {
        fprintf(stderr, "Log (ERROR) @%u.%03u: %s\n", sec, msec, msg);
    } else if (priority >= pxeboot::log::WARNING) {
        fprintf(stdout, "Log (WARN)  @%u.%03u: %s\n", sec, msec, msg);
    } else if (priority >= pxeboot::log::INFO) {
        fprintf(stdout, "Log (INFO)  @%u.%03u: %s\n", sec, msec, msg);
    } else {
        fprintf(stdout, "Log (DEBUG) @%u.%03u: %s\n", sec, msec, msg);
    }
    fflush(stdout);
}

std::string pxeboot::log::format(const pxeboot::eth::MacAddr& addr)
{
    char tmp[32];
    snprintf(tmp, sizeof(tmp),
        "%02X:%02X:%02X:%02X:%02X:%02X",
        addr.addr[0], addr.addr[1], addr.addr[2],
        addr.addr[3], addr.addr[4], addr.addr[5]);
    return std::string(tmp);
}

std::string pxeboot::log::format(const pxeboot::ip::Addr& addr)
{
    // Extract individual byte fields from IPv4 address.
    u8 addr_bytes[4];
    write_be_u32(addr_bytes, addr.value);
    // Format using conventional format (e.g., "127.0.0.1")
    std::stringstream tmp;
    tmp << (unsigned)addr_bytes[0] << "."
        << (unsigned)addr_bytes[1] << "."
        << (unsigned)addr_bytes[2] << "."
        << (unsigned)addr_bytes[3];
    return tmp.str();
}
