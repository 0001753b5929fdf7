//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Ethernet hardware addresses
//
// DHCP clients identify themselves by the 6-byte hardware address
// carried in the "chaddr" field.  The lease table is keyed on this type.

#pragma once

#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>

namespace pxeboot {
    namespace eth {
        // An Ethernet MAC address (with serializable interface).
        struct MacAddr {
            // Byte array in network order (Index 0 = MSB)
            u8 addr[6];

            // Numeric conversion functions.
            static constexpr pxeboot::eth::MacAddr from_u64(u64 x) {
                return MacAddr {{
                    (u8)(x >> 40), (u8)(x >> 32), (u8)(x >> 24),
                    (u8)(x >> 16), (u8)(x >>  8), (u8)(x >>  0)}};
            }
            constexpr u64 to_u64() const {
                return 1099511627776ULL * addr[0]
                     +    4294967296ULL * addr[1]
                     +      16777216ULL * addr[2]
                     +         65536ULL * addr[3]
                     +           256ULL * addr[4]
                     +             1ULL * addr[5];
            }

            // Basic comparisons.
            bool operator==(const pxeboot::eth::MacAddr& other) const;
            bool operator<(const pxeboot::eth::MacAddr& other) const;
            inline bool operator!=(const pxeboot::eth::MacAddr& other) const
                {return !operator==(other);}

            // I/O functions.
            inline void write_to(pxeboot::io::Writeable* wr) const
                {wr->write_bytes(6, addr);}
            inline bool read_from(pxeboot::io::Readable* rd)
                {return rd->read_bytes(6, addr);}

            // Log formatting, e.g., "DE:AD:BE:EF:CA:FE".
            void log_to(pxeboot::log::LogBuffer& wr) const;
        };

        constexpr pxeboot::eth::MacAddr MACADDR_NONE =
            {{0x00, 0x00, 0x00, 0x00, 0x00, 0x00}};
    }
}
