//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <pxeboot/eth_header.h>
#include <pxeboot/log.h>

using pxeboot::eth::MacAddr;

bool MacAddr::operator==(const MacAddr& other) const
{
    return (addr[0] == other.addr[0])
        && (addr[1] == other.addr[1])
        && (addr[2] == other.addr[2])
        && (addr[3] == other.addr[3])
        && (addr[4] == other.addr[4])
        && (addr[5] == other.addr[5]);
}

bool MacAddr::operator<(const MacAddr& other) const
{
    for (unsigned a = 0 ; a < 6 ; ++a) {
        if (addr[a] < other.addr[a]) return true;
        if (addr[a] > other.addr[a]) return false;
    }
    return false;   // All bytes equal
}

void MacAddr::log_to(pxeboot::log::LogBuffer& wr) const
{
    // Convention is six hex bytes with ":" delimeter.
    for (unsigned a = 0 ; a < 6 ; ++a) {
        if (a) wr.wr_str(":");
        wr.wr_hex(addr[a], 2);
    }
}
