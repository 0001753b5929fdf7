//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Miscellaneous simulation and test helper functions.
//!
//!\details
//! This file contains a variety of "small" utilities used in unit tests,
//! including a scripted `udp::Socket` and builders for the client side
//! of each protocol.  Anything that requires more than a few lines of
//! code should generally be moved into its own file.

#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <hal_posix/posix_utils.h>
#include <pxeboot/dhcp_packet.h>
#include <pxeboot/log.h>
#include <pxeboot/udp_core.h>

//! Boilerplate for configuring each unit test.
//! Includes a hard-reset of PxeBoot global variables and enables log::ToConsole.
//! An error in this macro indicates the *previous* test didn't exit cleanly.
#define PXEBOOT_TEST_START \
    CHECK(pxeboot::log::pre_test_reset()); \
    CHECK(pxeboot::test::pre_test_reset()); \
    pxeboot::log::ToConsole log;

namespace pxeboot {
    namespace test {
        //! Reset the global PRNG state used for rand_*(), below.
        bool pre_test_reset();

        //! Reproducible PRNG used for unit tests.
        //!@{
        u8  rand_u8();
        u32 rand_u32();
        //!@}

        //! Generate a unique filename for storing unit-test results.
        //! Output is "simulations/[pre]_[###].[ext]".
        //! (Where ### is a sequential counter for each unique "pre" value.)
        std::string sim_filename(const char* pre, const char* ext);

        //! Create an empty scratch folder "simulations/[pre]_[###]".
        //! Returns the folder name, or an empty string on error.
        std::string sim_folder(const char* pre);

        //! Create a file with the designated contents.
        bool write_file(const std::string& path, const std::string& data);

        //! Generate a string of random bytes.
        std::string random_string(unsigned nbytes);

        //! Record every Log message, for checks on events that are
        //! followed by other messages.  \see log::ToConsole::contains
        class LogRecorder final : public pxeboot::log::EventHandler {
        public:
            //! Number of recorded messages containing a substring.
            unsigned count(const char* msg) const;
            //! Does any recorded message contain a substring?
            inline bool any(const char* msg) const {return count(msg) > 0;}
            //! Total number of recorded messages.
            unsigned total() const;
            //! Discard all recorded messages.
            void clear();

        protected:
            void log_event(s8 priority, unsigned nbytes, const char* msg) override;
            mutable std::mutex m_mutex;
            std::vector<std::string> m_msgs;
        };

        //! Mockup of a UDP socket for testing protocol logic.
        //!
        //! Each call to `recv()` returns the next queued datagram.  When
        //! the queue is empty it returns RECV_TIMEOUT immediately, or
        //! RECV_ERROR after `close()`.  Every `send()` is recorded.
        //!
        //! A "child" socket has its own local port but shares its parent's
        //! receive queue and send log.  This allows a server under test to
        //! open per-transfer sockets while the test controls all traffic.
        class MockSocket : public pxeboot::udp::Socket {
        public:
            //! Record of one transmitted datagram.
            struct Sent {
                pxeboot::udp::Endpoint dst;     //!< Destination endpoint
                pxeboot::udp::Port src;         //!< Local port of sender
                std::vector<u8> data;           //!< Datagram contents
            };

            //! Create a top-level socket bound to the given port.
            explicit MockSocket(const pxeboot::udp::Port& port);

            //! Create a child socket with the next unused port.
            explicit MockSocket(pxeboot::test::MockSocket* parent);

            //! Queue an incoming datagram.
            //!@{
            void push(const pxeboot::udp::Endpoint& src,
                const void* data, unsigned len);
            void push(const pxeboot::udp::Endpoint& src,
                const std::vector<u8>& data);
            //!@}

            //! Queue a transient receive error.
            void push_error();

            //! Sends to this address will fail from now on.
            void fail_send(const pxeboot::ip::Addr& dst);

            //! Report RECV_ERROR once the queue is exhausted.
            //! The socket reads as open until then.
            void close();

            //! Inspect transmitted datagrams.
            //!@{
            unsigned sent_count() const;
            Sent sent(unsigned idx) const;
            void sent_clear();
            //!@}

            //! Number of child sockets created so far.
            unsigned child_count() const;

            //! Number of datagrams waiting in the receive queue.
            unsigned queued() const;

            // Implement the udp::Socket API.
            bool send(
                const pxeboot::udp::Endpoint& dst,
                const void* data, unsigned len) override;
            int recv(
                pxeboot::udp::Endpoint& src,
                void* data, unsigned len,
                unsigned timeout_msec) override;
            pxeboot::udp::Port local_port() const override
                {return m_port;}
            bool is_open() const override;

        protected:
            // Shared state lives in the top-level object.
            struct Rcvd {
                pxeboot::udp::Endpoint src;
                std::vector<u8> data;
                bool error;
            };

            pxeboot::test::MockSocket* const m_root;
            const pxeboot::udp::Port m_port;
            mutable std::mutex m_mutex;
            std::deque<Rcvd> m_rxqueue;
            std::vector<Sent> m_sent;
            std::vector<pxeboot::ip::Addr> m_fail;
            unsigned m_children;
            bool m_closed;
        };

        //! Build a client request with the designated message type.
        //! Additional options may be added before encoding.
        pxeboot::ip::DhcpPacket make_dhcp(
            u8 msg_type, const pxeboot::eth::MacAddr& mac, u32 xid);

        //! Encode a DHCP packet into a byte vector.
        std::vector<u8> encode(const pxeboot::ip::DhcpPacket& pkt);

        //! Decode a DHCP packet.  Returns false on error.
        bool decode(const std::vector<u8>& data, pxeboot::ip::DhcpPacket& pkt);

        //! Build each type of TFTP client packet.
        //!@{
        std::vector<u8> tftp_rrq(const char* filename, const char* mode = "octet");
        std::vector<u8> tftp_wrq(const char* filename, const char* mode = "octet");
        std::vector<u8> tftp_ack(u16 block);
        std::vector<u8> tftp_error(u16 code, const char* msg);
        //!@}

        //! Read TFTP header fields.  Returns zero if too short.
        //!@{
        u16 tftp_opcode(const std::vector<u8>& pkt);
        u16 tftp_block(const std::vector<u8>& pkt);
        //!@}

        //! Extract the payload from a TFTP DATA packet.
        std::string tftp_payload(const std::vector<u8>& pkt);
    }
}
