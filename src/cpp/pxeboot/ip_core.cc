//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <pxeboot/ip_core.h>
#include <pxeboot/log.h>
#include <pxeboot/utils.h>

namespace ip = pxeboot::ip;

void ip::Addr::log_to(pxeboot::log::LogBuffer& wr) const {
    // Extract individual bytes from the 32-bit IP-address.
    u32 ip_bytes[] = {
        (value >> 24) & 0xFF,   // MSB-first
        (value >> 16) & 0xFF,
        (value >>  8) & 0xFF,
        (value >>  0) & 0xFF,
    };

    // Convention is 4 decimal numbers with "." delimiter.
    // e.g., "192.168.1.42"
    for (unsigned a = 0 ; a < 4 ; ++a) {
        if (a) wr.wr_str(".");
        wr.wr_dec(ip_bytes[a]);
    }
}

void ip::Subnet::log_to(pxeboot::log::LogBuffer& wr) const {
    // Example: "10.0.0.1 / 255.255.255.0"
    addr.log_to(wr);
    wr.wr_str(" / ");
    mask.log_to(wr);
}

bool ip::Addr::is_broadcast() const {
    return (value == 0xFFFFFFFFu);
}

bool ip::Addr::is_multicast() const {
    if (value == 0xFFFFFFFFu)
        return true;    // Limited broadcast (255.255.255.255 /32)
    else if (0xE0000000u <= value && value <= 0xEFFFFFFFu)
        return true;    // IP multicast (224.0.0.0 /4)
    else
        return false;   // All other addresses
}

bool ip::Addr::is_unicast() const {
    return value && !is_multicast();
}

bool ip::Addr::is_valid() const {
    return value != 0;
}

unsigned ip::Mask::prefix() const {
    return pxeboot::util::popcount(value);
}

bool ip::Mask::is_contiguous() const {
    return value == ip::cidr_prefix(prefix());
}

bool ip::parse_addr(const char* str, ip::Addr& out) {
    if (!str) return false;
    u32 result = 0;
    for (unsigned a = 0 ; a < 4 ; ++a) {
        // Each octet is one to three decimal digits, then '.' or end.
        unsigned octet = 0, ndigits = 0;
        while ('0' <= *str && *str <= '9' && ndigits < 3) {
            octet = 10 * octet + unsigned(*str - '0');
            ++str; ++ndigits;
        }
        if (ndigits == 0 || octet > 255) return false;
        result = (result << 8) | octet;
        if (a < 3 && *(str++) != '.') return false;
    }
    if (*str) return false;     // Trailing garbage?
    out = ip::Addr(result);
    return true;
}
