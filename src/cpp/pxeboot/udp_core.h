//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Core definitions for UDP datagram endpoints
//!
//!\details
//! The DHCP and TFTP services exchange whole datagrams through the
//! abstract `udp::Socket` interface defined here.  The production
//! implementation wraps a BSD socket (hal_posix/udp_socket.h); unit
//! tests substitute a scripted mock (hal_test/sim_utils.h).

#pragma once

#include <pxeboot/ip_core.h>

namespace pxeboot {
    namespace udp {
        // UDP ports are 16-bit unsigned integers.
        struct Port {
            // Raw access to the underlying representation.
            u16 value;

            // Constructor.
            constexpr Port(u16 port) : value(port) {}   // NOLINT

            // Commonly used operators.
            constexpr bool operator==(const pxeboot::udp::Port& other) const
                {return value == other.value;}
            constexpr bool operator!=(const pxeboot::udp::Port& other) const
                {return value != other.value;}
        };

        // Well-known UDP ports used by the PXE services.
        constexpr pxeboot::udp::Port PORT_NONE          = 0;
        constexpr pxeboot::udp::Port PORT_DHCP_SERVER   = 67;
        constexpr pxeboot::udp::Port PORT_DHCP_CLIENT   = 68;
        constexpr pxeboot::udp::Port PORT_TFTP_SERVER   = 69;

        // Remote address and port for a single datagram.
        struct Endpoint {
            pxeboot::ip::Addr addr;
            pxeboot::udp::Port port;

            constexpr Endpoint()
                : addr(pxeboot::ip::ADDR_NONE), port(PORT_NONE) {}
            constexpr Endpoint(const pxeboot::ip::Addr& a, const pxeboot::udp::Port& p)
                : addr(a), port(p) {}

            constexpr bool operator==(const pxeboot::udp::Endpoint& other) const
                {return (addr == other.addr) && (port == other.port);}
            constexpr bool operator!=(const pxeboot::udp::Endpoint& other) const
                {return (addr != other.addr) || (port != other.port);}

            // Log formatting, e.g., "10.0.0.100:68".
            void log_to(pxeboot::log::LogBuffer& wr) const;
        };

        // Special return codes for Socket::recv().
        constexpr int RECV_TIMEOUT  = -1;   // No datagram before deadline
        constexpr int RECV_ERROR    = -2;   // Socket closed or failed

        // Special timeout for Socket::recv().
        constexpr unsigned WAIT_FOREVER = 0;

        // Abstract datagram endpoint bound to a local port.
        class Socket {
        public:
            // Send one datagram to the designated endpoint.
            // Returns true if the datagram was accepted for delivery.
            virtual bool send(
                const pxeboot::udp::Endpoint& dst,
                const void* data, unsigned len) = 0;

            // Wait for the next datagram, up to the designated timeout.
            // Oversize datagrams are truncated to fit the buffer.
            // Returns the received length, RECV_TIMEOUT, or RECV_ERROR.
            virtual int recv(
                pxeboot::udp::Endpoint& src,
                void* data, unsigned len,
                unsigned timeout_msec) = 0;

            // Local port number, if known.
            virtual pxeboot::udp::Port local_port() const = 0;

            // Can this socket still deliver datagrams?
            // Receive loops stop on errors once this returns false.
            virtual bool is_open() const {return true;}

            virtual ~Socket() {}

        protected:
            Socket() {}
        };
    }
}
