//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//
// TFTP server implementation using FileReader and SocketPosix
//

#pragma once

#include <hal_posix/file_io.h>
#include <pxeboot/udp_tftp.h>
#include <string>

namespace pxeboot {
    namespace udp {
        // A server handles requests from remote clients.
        // For safety reasons, file operations are limited to the
        // designated root folder.  Paths are sanitized by the core
        // before they reach read().  Each transfer is served from a
        // new SocketPosix bound to an ephemeral port.
        class TftpServerPosix : public pxeboot::udp::TftpServerCore {
        public:
            TftpServerPosix(
                pxeboot::udp::Socket* sock,
                const char* root_folder);
            virtual ~TftpServerPosix() {}

            inline const std::string& root_folder() const
                {return m_root_folder;}

        protected:
            // Required overrides from TftpServerCore.
            pxeboot::io::Readable* read(const char* path) override;
            pxeboot::udp::Socket* open_socket() override;

            // Root folder, always with a trailing separator.
            const std::string m_root_folder;
        };
    }
}
