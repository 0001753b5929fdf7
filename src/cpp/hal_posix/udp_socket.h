//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Connect the PxeBoot datagram interface to a Linux UDP socket.

#pragma once

#include <pxeboot/udp_core.h>

namespace pxeboot {
    namespace udp {
        //! Connect the `udp::Socket` interface to a POSIX UDP socket.
        //! This is a thin-wrapper around the "sys/socket.h" API.  Each
        //! call to recv() blocks in poll() until a datagram arrives or
        //! the timeout expires.  Descriptor numbers are not limited.  Concurrent send() calls from different
        //! threads are safe; recv() should be called from one thread.
        class SocketPosix : public pxeboot::udp::Socket {
        public:
            SocketPosix();
            virtual ~SocketPosix();

            //! Close the socket and return to idle.
            void close();

            //! Open the socket and bind it to a local port.
            //! Port zero requests an ephemeral port from the OS.
            //! Address ADDR_NONE binds to all local interfaces.
            bool bind(
                const pxeboot::udp::Port& port,
                const pxeboot::ip::Addr& addr = pxeboot::ip::ADDR_NONE);

            //! Allow sending to broadcast addresses.
            bool set_broadcast(bool enable);

            //! Restrict this socket to the named network interface.
            //! (Usually requires elevated privileges.)
            bool bind_device(const char* iface);

            //! Is the socket open?
            bool is_open() const override {return m_sock >= 0;}

            // Implement the udp::Socket API.
            bool send(
                const pxeboot::udp::Endpoint& dst,
                const void* data, unsigned len) override;
            int recv(
                pxeboot::udp::Endpoint& src,
                void* data, unsigned len,
                unsigned timeout_msec) override;
            pxeboot::udp::Port local_port() const override;

        private:
            // Forbid use of copy constructor.
            SocketPosix(const SocketPosix&) = delete;
            SocketPosix& operator=(const SocketPosix&) = delete;

            int m_sock;                     //!< Socket descriptor, or -1.
            pxeboot::udp::Port m_port;      //!< Bound local port.
        };

        //! Does a network interface with this name exist?
        bool iface_exists(const char* iface);
    }
}
