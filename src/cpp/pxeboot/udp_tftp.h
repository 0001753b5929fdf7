//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//
// Read-only server for the Trivial File Transfer Protocol (TFTP)
//
// Trivial File Transfer Protocol (TFTP) is a simple lockstep file transfer
// protocol that allows a client to download a file from a remote host over
// UDP.  It prioritizes simplicity over performance or security.
//
// The server conforms to IETF RFC 1350 with the following exceptions:
//  * Only read requests are supported.  Write requests are refused
//    with error code 4 (Illegal TFTP operation).
//  * The transfer mode is ignored; all files are sent as-is.
//  * Option negotiation (RFC 2347) is not supported.  Options in the
//    request are ignored, which implicitly declines them.
//
// Each accepted read request is served by its own `TftpTransfer`, running
// on its own thread with a dedicated ephemeral-port socket.  Transfers
// share no state with each other or with the listening socket.
//

#pragma once

#include <atomic>
#include <string>
#include <pxeboot/udp_core.h>

namespace pxeboot {
    namespace udp {
        // TFTP opcodes (RFC 1350, Section 5)
        constexpr u16 TFTP_OPCODE_RRQ       = 1;    // Read request
        constexpr u16 TFTP_OPCODE_WRQ       = 2;    // Write request
        constexpr u16 TFTP_OPCODE_DATA      = 3;    // Data
        constexpr u16 TFTP_OPCODE_ACK       = 4;    // Acknowledgement
        constexpr u16 TFTP_OPCODE_ERROR     = 5;    // Error

        // TFTP error codes (RFC 1350, Appendix I)
        // (Additional codes exist, but these are the ones we use.)
        constexpr u16 TFTP_ERROR_UNDEFINED  = 0;    // See message
        constexpr u16 TFTP_ERROR_NOFILE     = 1;    // File not found
        constexpr u16 TFTP_ERROR_PROTOCOL   = 4;    // Illegal TFTP operation
        constexpr u16 TFTP_ERROR_BADTID     = 5;    // Unknown transfer ID

        // Transfer parameters.
        constexpr unsigned TFTP_BLOCK_SIZE  = 512;
        constexpr unsigned TFTP_MAX_PACKET  = TFTP_BLOCK_SIZE + 4;
        constexpr unsigned TFTP_TIMEOUT_MSEC = 3000;
        constexpr unsigned TFTP_MAX_ATTEMPTS = 5;

        // Outcome of a single transfer.
        enum class TftpResult {
            COMPLETE,       // Final block acknowledged
            TIMEOUT,        // Attempt limit reached for one block
            ABORTED,        // Client sent an ERROR packet
            READ_ERROR,     // Source could not supply data
            SEND_ERROR,     // Socket refused a datagram
            RECV_ERROR,     // Socket closed or failed
        };

        // Human-readable label for a TftpResult.
        const char* tftp_result_label(pxeboot::udp::TftpResult result);

        // Format and send a single ERROR packet.
        // Returns true if the socket accepted the datagram.
        bool tftp_send_error(
            pxeboot::udp::Socket* sock,
            const pxeboot::udp::Endpoint& dst,
            u16 errcode, const char* errstr);

        // Sanitize a client-supplied filename.  Repeated and trailing
        // separators and "." segments are removed, as is the leading "/".
        // Returns false if any segment is "..", without touching "out".
        bool tftp_clean_path(const char* filename, std::string& out);

        // One server-to-client transfer (DATA-ACK-DATA-ACK).
        // The object sends blocks from the source until it reaches the end
        // of the data, then returns once the final short block (possibly
        // zero-length) is acknowledged.
        class TftpTransfer {
        public:
            // Bind a transfer to its socket, client, and data source.
            TftpTransfer(
                pxeboot::udp::Socket* sock,
                const pxeboot::udp::Endpoint& remote,
                pxeboot::io::Readable* src);

            // Adjust retry parameters before calling run().
            inline void set_timeout(unsigned msec)
                {m_timeout_msec = msec;}
            inline void set_attempts(unsigned count)
                {m_max_attempts = count;}

            // Blocking transfer of the entire source.
            pxeboot::udp::TftpResult run();

            // Transfer progress, measured in acknowledged 512-byte
            // blocks or in acknowledged bytes.
            inline u32 progress_blocks() const
                {return m_block_id;}
            inline u64 progress_bytes() const
                {return m_xfer_bytes;}

        protected:
            // Send the packet in m_buff and wait for the matching ACK,
            // resending on timeout or mismatch up to the attempt limit.
            pxeboot::udp::TftpResult send_and_wait(unsigned len, u16 block);

            // Interface objects.
            pxeboot::udp::Socket* const m_sock;
            const pxeboot::udp::Endpoint m_remote;
            pxeboot::io::Readable* const m_src;

            // Retry parameters.
            unsigned m_timeout_msec;
            unsigned m_max_attempts;

            // Transfer state uses an extended 32-bit block counter;
            // only the 16 LSBs are sent on the wire.
            u32 m_block_id;
            u64 m_xfer_bytes;

            // Working buffer for outgoing DATA packets.
            u8 m_buff[TFTP_MAX_PACKET];
        };

        // ServerCore is the base class that handles TFTP network functions.
        // However, it depends on children to define the I/O functions.
        // See also: TftpServerPosix (hal_posix/file_tftp.h)
        class TftpServerCore {
        public:
            // Blocking receive loop; returns after stop() or socket failure.
            void serve();

            // Ask the receive loop to exit after its current wait.
            inline void stop() {m_running = false;}

            // Adjust retry parameters for subsequent transfers.
            inline void set_timeout(unsigned msec)
                {m_timeout_msec = msec;}
            inline void set_attempts(unsigned count)
                {m_max_attempts = count;}

            virtual ~TftpServerCore() {}

        protected:
            friend pxeboot::test::TftpServer;

            // Users cannot instantiate this class directly.
            explicit TftpServerCore(pxeboot::udp::Socket* sock);

            // Child class MUST override these methods.
            // Each returns a new object owned by the caller, or null.
            //  * read() opens a sanitized path for reading.
            //  * open_socket() creates a socket on a fresh ephemeral port.
            virtual pxeboot::io::Readable* read(const char* path) = 0;
            virtual pxeboot::udp::Socket* open_socket() = 0;

            // Hand off an accepted request to spawn().  If no thread
            // can be started, the request is logged and dropped.
            virtual void dispatch(
                const pxeboot::udp::Endpoint& remote,
                const std::string& path);

            // Start a detached thread that calls transfer().
            // Throws std::system_error on failure.
            virtual void spawn(
                const pxeboot::udp::Endpoint& remote,
                const std::string& path);

            // Event handler for each datagram on the listening socket.
            void frame_rcvd(
                const pxeboot::udp::Endpoint& src,
                const u8* data, unsigned len);

            // Serve one read request from start to finish.
            void transfer(pxeboot::udp::Endpoint remote, std::string path);

            // Refuse a request from a fresh socket.
            void refuse(
                const pxeboot::udp::Endpoint& remote,
                u16 errcode, const char* errstr);

            // Interface objects.
            pxeboot::udp::Socket* const m_sock;
            std::atomic<bool> m_running;

            // Retry parameters for new transfers.
            unsigned m_timeout_msec;
            unsigned m_max_attempts;
        };
    }
}
