//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Basic type aliases and prototypes used throughout PxeBoot

#pragma once

#include <cinttypes>

// Shortcuts for fixed-size integer types.
typedef uint8_t     u8;
typedef uint16_t    u16;
typedef uint32_t    u32;
typedef uint64_t    u64;
typedef int8_t      s8;
typedef int16_t     s16;
typedef int32_t     s32;
typedef int64_t     s64;

// Prototypes for widely-used interfaces and data-structures.
// (Comment indicates the file containing the full definition.)
namespace pxeboot {
    namespace eth {                 // Ethernet addressing
        struct MacAddr;             // pxeboot/eth_header.h
    }

    namespace io {                  // Input and output streams
        class ArrayRead;            // pxeboot/io_readable.h
        class ArrayWrite;           // pxeboot/io_writeable.h
        class Readable;             // pxeboot/io_readable.h
        class Writeable;            // pxeboot/io_writeable.h
        class FileReader;           // hal_posix/file_io.h
        class FileWriter;           // hal_posix/file_io.h
    }

    namespace ip {                  // Internet Protocol v4
        struct Addr;                // pxeboot/ip_core.h
        struct Mask;                // pxeboot/ip_core.h
        struct Subnet;              // pxeboot/ip_core.h
        class DhcpPacket;           // pxeboot/dhcp_packet.h
        class DhcpPool;             // pxeboot/dhcp_pool.h
        class DhcpServer;           // pxeboot/ip_dhcp.h
    }

    namespace log {                 // Logging
        class EventHandler;         // pxeboot/log.h
        class Log;                  // pxeboot/log.h
        class LogBuffer;            // pxeboot/log.h
        class ToConsole;            // hal_posix/posix_utils.h
    }

    namespace test {                // Unit-test helpers
        class DhcpServer;           // sim/cpp/test_ip_dhcp.cc
        class MockSocket;           // hal_test/sim_utils.h
        class TftpServer;           // sim/cpp/test_udp_tftp.cc
    }

    namespace udp {                 // UDP networking
        struct Endpoint;            // pxeboot/udp_core.h
        struct Port;                // pxeboot/udp_core.h
        class Socket;               // pxeboot/udp_core.h
        class SocketPosix;          // hal_posix/udp_socket.h
        class TftpServerCore;       // pxeboot/udp_tftp.h
        class TftpServerPosix;      // hal_posix/file_tftp.h
        class TftpTransfer;         // pxeboot/udp_tftp.h
    }
}
