//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <system_error>
#include <thread>
#include <pxeboot/ip_dhcp.h>
#include <pxeboot/log.h>
#include <pxeboot/utils.h>

namespace ip = pxeboot::ip;
using pxeboot::io::ArrayRead;
using pxeboot::io::ArrayWrite;
using pxeboot::ip::Addr;
using pxeboot::ip::DhcpPacket;
using pxeboot::ip::DhcpServer;
using pxeboot::udp::Endpoint;
using pxeboot::udp::PORT_DHCP_CLIENT;

// Set verbosity level for debugging (0/1/2).
static constexpr unsigned DEBUG_VERBOSE = 0;

// Hardware type and length for Ethernet.
static constexpr u8 HTYPE_ETHERNET = 1;
static constexpr u8 HLEN_ETHERNET = 6;

// Maximum accepted request size (one Ethernet MTU).
static constexpr unsigned MAX_REQUEST = 1500;

// The receive loop wakes at this interval to check for stop().
static constexpr unsigned POLL_MSEC = 1000;

// Consecutive receive errors tolerated before the loop gives up.
static constexpr unsigned MAX_RECV_ERRORS = 8;

// PXE client-architecture codes that indicate UEFI (RFC 4578).
static constexpr u16 ARCH_EFI_BC  = 7;
static constexpr u16 ARCH_EFI_X64 = 9;

DhcpServer::DhcpServer(
        pxeboot::udp::Socket* sock,
        ip::DhcpPool* pool,
        const Addr& server_ip)
    : m_sock(sock)
    , m_pool(pool)
    , m_running(false)
    , m_server_ip(server_ip)
    , m_mask(ip::MASK_24)
    , m_boot_file()
    , m_tftp_server()
    , m_lease_time(ip::DHCP_LEASE_SECONDS)
{
    // Default TFTP server name is our own address in dotted-quad form.
    log::LogBuffer buff;
    server_ip.log_to(buff);
    m_tftp_server = buff.c_str();
}

void DhcpServer::serve()
{
    Log(log::INFO, "DHCP", "Listening")
        .write(m_server_ip).write10(m_sock->local_port().value);

    u8 buff[MAX_REQUEST];
    unsigned errors = 0;
    m_running = true;
    while (m_running) {
        Endpoint src;
        int len = m_sock->recv(src, buff, sizeof(buff), POLL_MSEC);
        if (len == pxeboot::udp::RECV_TIMEOUT) continue;
        if (len < 0) {
            if (!m_sock->is_open() || ++errors >= MAX_RECV_ERRORS) {
                Log(log::ERROR, "DHCP", "Receive failed, stopping");
                break;
            }
            Log(log::WARNING, "DHCP", "Receive failed, retrying").write10(errors);
            continue;
        }
        errors = 0;
        if (DEBUG_VERBOSE > 1)
            Log(log::DEBUG, "DHCP", "Received from ").write_obj(src).write10(len);
        frame_rcvd(buff, (unsigned)len);
    }
    m_running = false;
}

void DhcpServer::frame_rcvd(const u8* data, unsigned len)
{
    // Attempt to parse the incoming message.
    DhcpPacket req;
    ArrayRead rd(data, len);
    if (!req.read_from(&rd)) {
        Log(log::DEBUG, "DHCP", "Malformed packet dropped").write10(len);
        return;
    }

    // Only clients send BOOTREQUEST.
    if (req.op != ip::DHCP_OP_REQUEST) {
        Log(log::DEBUG, "DHCP", "Non-request dropped").write(req.op);
        return;
    }

    // Accept DISCOVER and REQUEST, log and ignore everything else.
    u8 type = req.message_type();
    if (type == ip::DHCP_DISCOVER) {
        Log(log::INFO, "DHCP", "Discover from").write(req.chaddr);
        dispatch(req);
    } else if (type == ip::DHCP_REQUEST) {
        Log(log::INFO, "DHCP", "Request from").write(req.chaddr);
        dispatch(req);
    } else {
        Log(log::INFO, "DHCP", "Unsupported message type")
            .write10(type).write(req.chaddr);
    }
}

void DhcpServer::dispatch(const DhcpPacket& req)
{
    try {
        spawn(req);
    } catch (const std::system_error& e) {
        Log(log::ERROR, "DHCP", "Unable to start handler")
            .write(req.chaddr).write(", ").write(e.what());
    }
}

void DhcpServer::spawn(const DhcpPacket& req)
{
    std::thread(&DhcpServer::respond, this, req).detach();
}

void DhcpServer::respond(const DhcpPacket& req)
{
    // OFFER and ACK differ only in the message type.
    u8 type = req.message_type();
    u8 reply_type = (type == ip::DHCP_DISCOVER) ? ip::DHCP_OFFER : ip::DHCP_ACK;

    // Note requested address, if any.  Leases are fixed per client,
    // so this never changes the assignment.
    Addr requested;
    if (req.option_addr(ip::DHCP_OPTION_REQUEST_IP, requested))
        Log(log::DEBUG, "DHCP", "Requested address").write(requested).write(req.chaddr);

    // Note UEFI clients.  The boot filename is the same for all clients.
    u16 arch = 0;
    if (req.option_u16(ip::DHCP_OPTION_CLIENT_ARCH, arch)
        && (arch == ARCH_EFI_BC || arch == ARCH_EFI_X64)) {
        Log(log::INFO, "DHCP", "UEFI client").write10(arch)
            .write(", boot file ").write(m_boot_file.c_str());
    }

    // Allocate or reuse an address for this client.
    // The pool logs exhaustion; the request is dropped.
    Addr yiaddr = m_pool->allocate(req.chaddr);
    if (yiaddr == ip::ADDR_NONE) return;

    // Build and encode the reply.
    DhcpPacket reply;
    if (!build_reply(req, reply_type, yiaddr, reply)) {
        Log(log::ERROR, "DHCP", "Reply option too long").write(req.chaddr);
        return;
    }
    u8 buff[ip::DHCP_MAX_BYTES];
    ArrayWrite wr(buff, sizeof(buff));
    wr.write_obj(reply);
    if (!wr.write_finalize()) {
        Log(log::ERROR, "DHCP", "Reply exceeds maximum length")
            .write10(reply.encoded_len());
        return;
    }

    Log(log::INFO, "DHCP", reply_type == ip::DHCP_OFFER ? "Offer" : "Ack")
        .write(yiaddr).write(req.chaddr);
    deliver(buff, wr.written_len());
}

bool DhcpServer::build_reply(
    const DhcpPacket& req, u8 reply_type,
    const Addr& yiaddr, DhcpPacket& reply) const
{
    // Fixed header fields.
    reply.op        = ip::DHCP_OP_REPLY;
    reply.htype     = HTYPE_ETHERNET;
    reply.hlen      = HLEN_ETHERNET;
    reply.hops      = 0;
    reply.xid       = req.xid;      // Echo
    reply.secs      = 0;
    reply.flags     = req.flags;    // Echo
    reply.ciaddr    = ip::ADDR_NONE;
    reply.yiaddr    = yiaddr;
    reply.siaddr    = m_server_ip;
    reply.giaddr    = req.giaddr;   // Echo
    reply.chaddr    = req.chaddr;   // Echo

    // Some PXE clients read the header fields instead of the options.
    // Configuration limits both strings to fit their fields.
    if (!pxeboot::util::copy_field(reply.sname, sizeof(reply.sname), m_tftp_server.c_str()))
        Log(log::WARNING, "DHCP", "TFTP server name truncated");
    if (!pxeboot::util::copy_field(reply.file, sizeof(reply.file), m_boot_file.c_str()))
        Log(log::WARNING, "DHCP", "Boot filename truncated");

    // Options.
    ip::Subnet net = subnet();
    bool ok = reply.set_option_u8(ip::DHCP_OPTION_MSG_TYPE, reply_type);
    ok = ok && reply.set_option_addr(ip::DHCP_OPTION_SERVER_IP, m_server_ip);
    ok = ok && reply.set_option_addr(ip::DHCP_OPTION_SUBNET_MASK, m_mask);
    ok = ok && reply.set_option_addr(ip::DHCP_OPTION_ROUTER, m_server_ip);
    ok = ok && reply.set_option_addr(ip::DHCP_OPTION_DNS_SERVER, m_server_ip);
    ok = ok && reply.set_option_addr(ip::DHCP_OPTION_BROADCAST, net.broadcast());
    ok = ok && reply.set_option_u32(ip::DHCP_OPTION_LEASE_TIME, m_lease_time);
    ok = ok && reply.set_option_str(ip::DHCP_OPTION_BOOT_FILE, m_boot_file.c_str());
    ok = ok && reply.set_option_str(ip::DHCP_OPTION_TFTP_SERVER, m_tftp_server.c_str());
    return ok;
}

bool DhcpServer::deliver(const u8* data, unsigned len)
{
    // Candidate destinations, in order of preference.
    const Endpoint candidates[] = {
        Endpoint(subnet().broadcast(), PORT_DHCP_CLIENT),
        Endpoint(ip::ADDR_BROADCAST, PORT_DHCP_CLIENT),
    };
    constexpr unsigned NCANDIDATES = sizeof(candidates) / sizeof(candidates[0]);

    for (unsigned a = 0 ; a < NCANDIDATES ; ++a) {
        if (m_sock->send(candidates[a], data, len)) return true;
        if (a + 1 < NCANDIDATES) {
            Log(log::WARNING, "DHCP", "Broadcast failed to ")
                .write_obj(candidates[a]).write(", trying next");
        }
    }

    Log(log::ERROR, "DHCP", "Reply not sent");
    return false;
}
