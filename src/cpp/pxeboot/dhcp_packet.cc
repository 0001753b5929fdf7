//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <pxeboot/dhcp_packet.h>
#include <pxeboot/log.h>
#include <pxeboot/utils.h>

namespace ip = pxeboot::ip;
using pxeboot::ip::DhcpPacket;

// Set verbosity level for debugging (0/1/2).
static constexpr unsigned DEBUG_VERBOSE = 0;

// Ethernet hardware addresses occupy the first 6 bytes of "chaddr".
static constexpr unsigned MACADDR_LEN = 6;

// Length of header, cookie, options, and END tag, excluding padding.
static unsigned unpadded_len(const std::map<u8, std::vector<u8>>& options) {
    unsigned len = ip::DHCP_HEADER_BYTES + 1;
    for (auto it = options.begin() ; it != options.end() ; ++it)
        len += 2 + (unsigned)it->second.size();
    return len;
}

DhcpPacket::DhcpPacket()
    : op(0), htype(0), hlen(0), hops(0)
    , xid(0), secs(0), flags(0)
    , ciaddr(ip::ADDR_NONE), yiaddr(ip::ADDR_NONE)
    , siaddr(ip::ADDR_NONE), giaddr(ip::ADDR_NONE)
    , chaddr(pxeboot::eth::MACADDR_NONE)
{
    memset(sname, 0, sizeof(sname));
    memset(file, 0, sizeof(file));
}

bool DhcpPacket::read_from(pxeboot::io::Readable* rd)
{
    // Sanity check before we start.
    if (rd->get_read_ready() < ip::DHCP_HEADER_BYTES) {
        if (DEBUG_VERBOSE > 0)
            Log(log::DEBUG, "DHCP", "Packet too short")
                .write10(rd->get_read_ready());
        return false;
    }

    // Fixed-layout BOOTP header.
    op      = rd->read_u8();
    htype   = rd->read_u8();
    hlen    = rd->read_u8();
    hops    = rd->read_u8();
    xid     = rd->read_u32();
    secs    = rd->read_u16();
    flags   = rd->read_u16();
    rd->read_obj(ciaddr);
    rd->read_obj(yiaddr);
    rd->read_obj(siaddr);
    rd->read_obj(giaddr);
    rd->read_obj(chaddr);
    rd->read_consume(ip::DHCP_CHADDR_LEN - MACADDR_LEN);
    rd->read_bytes(sizeof(sname), sname);
    rd->read_bytes(sizeof(file), file);

    // Options are present only if we find the magic cookie.
    m_options.clear();
    u32 magic = rd->read_u32();
    if (magic != ip::DHCP_MAGIC) return true;

    // Walk the option list until END or end-of-input.
    // A truncated option simply ends the list (best-effort).
    u8 buff[ip::DHCP_OPTION_MAXLEN];
    while (rd->get_read_ready()) {
        u8 tag = rd->read_u8();
        if (tag == ip::DHCP_OPTION_END) break;
        if (tag == ip::DHCP_OPTION_PAD) continue;
        if (rd->get_read_ready() < 1) break;
        u8 len = rd->read_u8();
        if (rd->get_read_ready() < len) break;
        rd->read_bytes(len, buff);
        m_options[tag].assign(buff, buff + len);
    }

    return true;
}

void DhcpPacket::write_to(pxeboot::io::Writeable* wr) const
{
    // Fixed-layout BOOTP header.
    wr->write_u8(op);
    wr->write_u8(htype);
    wr->write_u8(hlen);
    wr->write_u8(hops);
    wr->write_u32(xid);
    wr->write_u16(secs);
    wr->write_u16(flags);
    wr->write_obj(ciaddr);
    wr->write_obj(yiaddr);
    wr->write_obj(siaddr);
    wr->write_obj(giaddr);
    wr->write_obj(chaddr);
    for (unsigned a = MACADDR_LEN ; a < ip::DHCP_CHADDR_LEN ; ++a)
        wr->write_u8(0);
    wr->write_bytes(sizeof(sname), sname);
    wr->write_bytes(sizeof(file), file);
    wr->write_u32(ip::DHCP_MAGIC);

    // Each option is tag, length, value.
    for (auto it = m_options.begin() ; it != m_options.end() ; ++it) {
        wr->write_u8(it->first);
        wr->write_u8((u8)it->second.size());
        if (!it->second.empty())
            wr->write_bytes((unsigned)it->second.size(), it->second.data());
    }
    wr->write_u8(ip::DHCP_OPTION_END);

    // Zero-pad to the BOOTP minimum length.
    unsigned len = unpadded_len(m_options);
    while (len < ip::DHCP_MIN_BYTES) {
        wr->write_u8(ip::DHCP_OPTION_PAD);
        ++len;
    }
}

unsigned DhcpPacket::encoded_len() const
{
    return pxeboot::util::max_unsigned(
        unpadded_len(m_options), ip::DHCP_MIN_BYTES);
}

bool DhcpPacket::set_option(u8 tag, const void* data, unsigned len)
{
    // PAD and END have no length field and cannot carry a value.
    if (tag == ip::DHCP_OPTION_PAD || tag == ip::DHCP_OPTION_END) return false;
    if (len > ip::DHCP_OPTION_MAXLEN) return false;
    const u8* src = (const u8*)data;
    m_options[tag].assign(src, src + len);
    return true;
}

bool DhcpPacket::set_option_u8(u8 tag, u8 value)
{
    return set_option(tag, &value, 1);
}

bool DhcpPacket::set_option_u32(u8 tag, u32 value)
{
    u8 temp[4];
    pxeboot::util::write_be_u32(temp, value);
    return set_option(tag, temp, sizeof(temp));
}

bool DhcpPacket::set_option_addr(u8 tag, const ip::Addr& addr)
{
    return set_option_u32(tag, addr.value);
}

bool DhcpPacket::set_option_str(u8 tag, const char* str)
{
    return set_option(tag, str, (unsigned)strlen(str));
}

const std::vector<u8>* DhcpPacket::option(u8 tag) const
{
    auto it = m_options.find(tag);
    return (it == m_options.end()) ? 0 : &it->second;
}

bool DhcpPacket::option_u16(u8 tag, u16& value) const
{
    const std::vector<u8>* opt = option(tag);
    if (!opt || opt->size() < 2) return false;
    value = pxeboot::util::extract_be_u16(opt->data());
    return true;
}

bool DhcpPacket::option_addr(u8 tag, ip::Addr& addr) const
{
    const std::vector<u8>* opt = option(tag);
    if (!opt || opt->size() < 4) return false;
    addr = ip::Addr(pxeboot::util::extract_be_u32(opt->data()));
    return true;
}

u8 DhcpPacket::message_type() const
{
    const std::vector<u8>* opt = option(ip::DHCP_OPTION_MSG_TYPE);
    return (opt && !opt->empty()) ? (*opt)[0] : 0;
}
