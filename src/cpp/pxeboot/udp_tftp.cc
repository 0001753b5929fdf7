//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <chrono>
#include <memory>
#include <system_error>
#include <thread>
#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>
#include <pxeboot/log.h>
#include <pxeboot/udp_tftp.h>
#include <pxeboot/utils.h>

// Shortcuts for commonly used names.
namespace udp = pxeboot::udp;
using pxeboot::io::ArrayRead;
using pxeboot::io::ArrayWrite;
using pxeboot::udp::Endpoint;
using pxeboot::udp::TftpResult;
using pxeboot::udp::TftpServerCore;
using pxeboot::udp::TftpTransfer;
using pxeboot::util::extract_be_u16;
using pxeboot::util::min_unsigned;
using pxeboot::util::write_be_u16;
typedef std::chrono::steady_clock Clock;

// Set verbosity level for debugging (0/1/2).
static constexpr unsigned DEBUG_VERBOSE = 0;

// Maximum accepted request size (one Ethernet MTU).
static constexpr unsigned MAX_REQUEST = 1500;

// The receive loop wakes at this interval to check for stop().
static constexpr unsigned POLL_MSEC = 1000;

// Consecutive receive errors tolerated before the loop gives up.
static constexpr unsigned MAX_RECV_ERRORS = 8;

const char* udp::tftp_result_label(TftpResult result) {
    switch (result) {
    case TftpResult::COMPLETE:      return "Transfer complete";
    case TftpResult::TIMEOUT:       return "Transfer timed out";
    case TftpResult::ABORTED:       return "Transfer aborted by client";
    case TftpResult::READ_ERROR:    return "File read error";
    case TftpResult::SEND_ERROR:    return "Send error";
    case TftpResult::RECV_ERROR:    return "Receive error";
    default:                        return "Unknown result";
    }
}

bool udp::tftp_send_error(
    udp::Socket* sock, const Endpoint& dst,
    u16 errcode, const char* errstr)
{
    if (DEBUG_VERBOSE > 1)
        Log(log::DEBUG, "TFTP", "Sending error").write(errcode);

    // Write out the ERROR packet (Section 5).
    u8 buff[udp::TFTP_MAX_PACKET];
    ArrayWrite pkt(buff, sizeof(buff));
    pkt.write_u16(udp::TFTP_OPCODE_ERROR);
    pkt.write_u16(errcode);
    pkt.write_str(errstr);
    pkt.write_u8(0);
    if (!pkt.write_finalize()) return false;
    return sock->send(dst, buff, pkt.written_len());
}

bool udp::tftp_clean_path(const char* filename, std::string& out) {
    if (!filename) return false;

    // Rebuild the path one segment at a time.
    std::string clean;
    const char* ptr = filename;
    while (*ptr) {
        const char* start = ptr;
        while (*ptr && *ptr != '/') ++ptr;
        std::string segment(start, ptr);
        if (*ptr == '/') ++ptr;
        if (segment.empty() || segment == ".") continue;
        if (segment == "..") return false;
        if (!clean.empty()) clean += '/';
        clean += segment;
    }

    out = clean;
    return true;
}

TftpTransfer::TftpTransfer(
        udp::Socket* sock,
        const Endpoint& remote,
        pxeboot::io::Readable* src)
    : m_sock(sock)
    , m_remote(remote)
    , m_src(src)
    , m_timeout_msec(udp::TFTP_TIMEOUT_MSEC)
    , m_max_attempts(udp::TFTP_MAX_ATTEMPTS)
    , m_block_id(0)
    , m_xfer_bytes(0)
{
    // Nothing else to initialize.
}

TftpResult TftpTransfer::run()
{
    m_block_id = 0;
    m_xfer_bytes = 0;

    while (1) {
        // Write the packet header.
        u32 next = m_block_id + 1;
        write_be_u16(m_buff + 0, udp::TFTP_OPCODE_DATA);
        write_be_u16(m_buff + 2, u16(next & 0xFFFF));

        // Copy the next block of data (max 512 bytes).
        unsigned len = min_unsigned(udp::TFTP_BLOCK_SIZE, m_src->get_read_ready());
        if (len > 0 && !m_src->read_bytes(len, m_buff + 4)) {
            Log(log::ERROR, "TFTP", "File read error")
                .write_obj(m_remote).write10(next);
            udp::tftp_send_error(m_sock, m_remote,
                udp::TFTP_ERROR_UNDEFINED, "File read error");
            return TftpResult::READ_ERROR;
        }

        // Send it and wait for acknowledgement.
        TftpResult result = send_and_wait(len + 4, u16(next & 0xFFFF));
        if (result != TftpResult::COMPLETE) return result;

        // A short block (possibly empty) ends the transfer.
        m_block_id = next;
        m_xfer_bytes += len;
        if (len < udp::TFTP_BLOCK_SIZE) return TftpResult::COMPLETE;
    }
}

TftpResult TftpTransfer::send_and_wait(unsigned len, u16 block)
{
    u8 rx[udp::TFTP_MAX_PACKET];

    for (unsigned attempt = 0 ; attempt < m_max_attempts ; ++attempt) {
        if (DEBUG_VERBOSE > 1)
            Log(log::DEBUG, "TFTP", "Sending block").write(block).write10(attempt);

        if (!m_sock->send(m_remote, m_buff, len)) {
            Log(log::WARNING, "TFTP", "Send failed to ")
                .write_obj(m_remote).write10(block);
            return TftpResult::SEND_ERROR;
        }

        // Wait until the deadline for an ACK with this block number.
        // (COMPLETE here means this block was acknowledged.)
        Clock::time_point deadline = Clock::now()
            + std::chrono::milliseconds(m_timeout_msec);
        while (1) {
            Clock::time_point now = Clock::now();
            if (now >= deadline) break;
            unsigned wait = (unsigned)std::chrono::duration_cast
                <std::chrono::milliseconds>(deadline - now).count();

            Endpoint src;
            int rcvd = m_sock->recv(src, rx, sizeof(rx), wait ? wait : 1);
            if (rcvd == udp::RECV_TIMEOUT) break;
            if (rcvd < 0) {
                Log(log::ERROR, "TFTP", "Receive failed from ").write_obj(m_remote);
                return TftpResult::RECV_ERROR;
            }

            // Datagrams from any other endpoint get an error reply
            // and do not disturb this transfer.
            if (src != m_remote) {
                Log(log::DEBUG, "TFTP", "Unknown transfer ID from ").write_obj(src);
                udp::tftp_send_error(m_sock, src,
                    udp::TFTP_ERROR_BADTID, "Unknown transfer ID");
                continue;
            }

            // Matching ACK?  Anything else from the client is a retry.
            u16 opcode = (rcvd >= 2) ? extract_be_u16(rx) : 0;
            if (rcvd >= 4 && opcode == udp::TFTP_OPCODE_ACK) {
                if (extract_be_u16(rx + 2) == block) return TftpResult::COMPLETE;
                if (DEBUG_VERBOSE > 0)
                    Log(log::DEBUG, "TFTP", "Mismatched ACK").write(extract_be_u16(rx + 2));
            } else if (rcvd >= 4 && opcode == udp::TFTP_OPCODE_ERROR) {
                char errstr[udp::TFTP_MAX_PACKET];
                ArrayRead rd(rx + 2, unsigned(rcvd - 2));
                u16 errcode = rd.read_u16();
                rd.read_str(sizeof(errstr), errstr);
                Log(log::WARNING, "TFTP", "Remote error")
                    .write(errcode).write(": ").write(errstr);
                return TftpResult::ABORTED;
            }
            break;
        }
    }

    // Give up without sending an ERROR packet.
    Log(log::WARNING, "TFTP", "No ACK, transfer abandoned ")
        .write_obj(m_remote).write10(block);
    return TftpResult::TIMEOUT;
}

TftpServerCore::TftpServerCore(udp::Socket* sock)
    : m_sock(sock)
    , m_running(false)
    , m_timeout_msec(udp::TFTP_TIMEOUT_MSEC)
    , m_max_attempts(udp::TFTP_MAX_ATTEMPTS)
{
    // Nothing else to initialize.
}

void TftpServerCore::serve()
{
    Log(log::INFO, "TFTP", "Listening").write10(m_sock->local_port().value);

    u8 buff[MAX_REQUEST];
    unsigned errors = 0;
    m_running = true;
    while (m_running) {
        Endpoint src;
        int len = m_sock->recv(src, buff, sizeof(buff), POLL_MSEC);
        if (len == udp::RECV_TIMEOUT) continue;
        if (len < 0) {
            if (!m_sock->is_open() || ++errors >= MAX_RECV_ERRORS) {
                Log(log::ERROR, "TFTP", "Receive failed, stopping");
                break;
            }
            Log(log::WARNING, "TFTP", "Receive failed, retrying").write10(errors);
            continue;
        }
        errors = 0;
        frame_rcvd(src, buff, (unsigned)len);
    }
    m_running = false;
}

void TftpServerCore::dispatch(const Endpoint& remote, const std::string& path)
{
    try {
        spawn(remote, path);
    } catch (const std::system_error& e) {
        Log(log::ERROR, "TFTP", "Unable to start handler for ")
            .write_obj(remote).write(", ").write(e.what());
    }
}

void TftpServerCore::spawn(const Endpoint& remote, const std::string& path)
{
    std::thread(&TftpServerCore::transfer, this, remote, path).detach();
}

void TftpServerCore::frame_rcvd(const Endpoint& src, const u8* data, unsigned len)
{
    // Every request has an opcode, and at least a filename terminator.
    if (len < 4) {
        if (DEBUG_VERBOSE > 0)
            Log(log::DEBUG, "TFTP", "Runt datagram from ").write_obj(src);
        return;
    }

    // Only respond to read-requests and write-requests.
    ArrayRead rd(data, len);
    u16 opcode = rd.read_u16();
    if (opcode == udp::TFTP_OPCODE_RRQ) {
        // Mode string and any options that follow are ignored.
        char filename[MAX_REQUEST];
        rd.read_str(sizeof(filename), filename);
        std::string path;
        if (!udp::tftp_clean_path(filename, path)) {
            // No reply, so we never confirm whether the path exists.
            Log(log::WARNING, "TFTP", "Rejected path ")
                .write(filename).write(" from ").write_obj(src);
            return;
        }
        Log(log::INFO, "TFTP", "Read request ")
            .write(path.c_str()).write(" from ").write_obj(src);
        dispatch(src, path);
    } else if (opcode == udp::TFTP_OPCODE_WRQ) {
        Log(log::INFO, "TFTP", "Write request refused from ").write_obj(src);
        refuse(src, udp::TFTP_ERROR_PROTOCOL, "Illegal TFTP operation");
    } else if (DEBUG_VERBOSE > 0) {
        Log(log::DEBUG, "TFTP", "Ignored opcode").write(opcode);
    }
}

void TftpServerCore::transfer(Endpoint remote, std::string path)
{
    // Each transfer uses its own socket on a fresh ephemeral port.
    std::unique_ptr<udp::Socket> sock(open_socket());
    if (!sock) {
        Log(log::ERROR, "TFTP", "Unable to open transfer socket");
        return;
    }

    // Open the requested file.
    std::unique_ptr<pxeboot::io::Readable> src(read(path.c_str()));
    if (!src) {
        Log(log::INFO, "TFTP", "File not found ").write(path.c_str());
        udp::tftp_send_error(sock.get(), remote,
            udp::TFTP_ERROR_NOFILE, "File not found");
        return;
    }

    // Run the transfer to completion.
    TftpTransfer xfer(sock.get(), remote, src.get());
    xfer.set_timeout(m_timeout_msec);
    xfer.set_attempts(m_max_attempts);
    TftpResult result = xfer.run();
    src->read_finalize();

    // Failures are logged where they are detected.
    s8 level = (result == TftpResult::COMPLETE) ? log::INFO : log::DEBUG;
    Log(level, "TFTP", udp::tftp_result_label(result))
        .write(" ").write(path.c_str()).write(" to ").write_obj(remote)
        .write10(xfer.progress_bytes());
}

void TftpServerCore::refuse(const Endpoint& remote, u16 errcode, const char* errstr)
{
    std::unique_ptr<udp::Socket> sock(open_socket());
    if (!sock) {
        Log(log::ERROR, "TFTP", "Unable to open transfer socket");
        return;
    }
    udp::tftp_send_error(sock.get(), remote, errcode, errstr);
}
