//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Dynamic Host Configuration Protocol (DHCP) server for PXE clients
//!
//!\details
//! This server answers DISCOVER with OFFER and REQUEST with ACK, using
//! the same reply for both: an address from the `DhcpPool`, the subnet
//! parameters, and the network-boot parameters (TFTP server and boot
//! filename) in both the fixed BOOTP header fields and the options.
//! Other message types are logged and ignored; there is no NAK, DECLINE,
//! or RELEASE handling.  Leases never expire.
//!
//! Replies are always broadcast to the client port, since the client has
//! no usable address yet.  The subnet broadcast address is tried first,
//! then the limited broadcast address (255.255.255.255).
//!
//! To use:
//!  * Bind a `udp::Socket` to port 67 with broadcast enabled.
//!  * Create a `DhcpPool` spanning the desired address range.
//!  * Create the `DhcpServer`, set the subnet and boot parameters.
//!  * Call `serve()` from a dedicated thread.
//!
//! Each accepted request is answered on its own thread, so the receive
//! loop never waits on reply construction or delivery.

#pragma once

#include <atomic>
#include <string>
#include <pxeboot/dhcp_packet.h>
#include <pxeboot/dhcp_pool.h>
#include <pxeboot/udp_core.h>

namespace pxeboot {
    namespace ip {
        // Default lease duration reported to clients.
        constexpr u32 DHCP_LEASE_SECONDS = 3600;

        //! DHCP server for PXE network boot.
        class DhcpServer {
        public:
            //! Bind this server to a socket, a pool, and the server address.
            DhcpServer(
                pxeboot::udp::Socket* sock,
                pxeboot::ip::DhcpPool* pool,
                const pxeboot::ip::Addr& server_ip);
            virtual ~DhcpServer() {}

            //! Configuration for outgoing replies.
            //! The TFTP server name defaults to the server IP address.
            //!@{
            inline void set_subnet(const pxeboot::ip::Mask& mask)
                {m_mask = mask;}
            inline void set_boot_file(const char* name)
                {m_boot_file = name;}
            inline void set_tftp_server(const char* name)
                {m_tftp_server = name;}
            inline void set_lease_time(u32 seconds)
                {m_lease_time = seconds;}
            //!@}

            //! Accessors for the current configuration.
            //!@{
            inline pxeboot::ip::Addr server_ip() const
                {return m_server_ip;}
            inline pxeboot::ip::Subnet subnet() const
                {return pxeboot::ip::Subnet{m_server_ip, m_mask};}
            inline const char* boot_file() const
                {return m_boot_file.c_str();}
            inline const char* tftp_server() const
                {return m_tftp_server.c_str();}
            //!@}

            //! Blocking receive loop; returns after stop() or socket failure.
            void serve();

            //! Ask the receive loop to exit after its current wait.
            inline void stop() {m_running = false;}

        protected:
            friend pxeboot::test::DhcpServer;

            // Event handler for each incoming datagram.
            void frame_rcvd(const u8* data, unsigned len);

            // Hand off an accepted request to spawn().  If no thread
            // can be started, the request is logged and dropped.
            virtual void dispatch(const pxeboot::ip::DhcpPacket& req);

            // Start a detached thread that calls respond().
            // Throws std::system_error on failure.
            virtual void spawn(const pxeboot::ip::DhcpPacket& req);

            // Allocate an address, build the reply, and send it.
            void respond(const pxeboot::ip::DhcpPacket& req);

            // Populate the reply for the designated request.
            // Returns false if any option could not be stored.
            bool build_reply(
                const pxeboot::ip::DhcpPacket& req,
                u8 reply_type, const pxeboot::ip::Addr& yiaddr,
                pxeboot::ip::DhcpPacket& reply) const;

            // Send an encoded reply to each broadcast destination in
            // turn, until one succeeds.  Returns true on success.
            bool deliver(const u8* data, unsigned len);

            // Interface objects.
            pxeboot::udp::Socket* const m_sock;
            pxeboot::ip::DhcpPool* const m_pool;
            std::atomic<bool> m_running;

            // Reply parameters.
            const pxeboot::ip::Addr m_server_ip;
            pxeboot::ip::Mask m_mask;
            std::string m_boot_file;
            std::string m_tftp_server;
            u32 m_lease_time;
        };
    }
}
