//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Core definitions for IPv4 addressing
//
// Addresses are stored as a u32 in host order (i.e., 192.168.1.42 is
// 0xC0A8012A) and serialized in network order.

#pragma once

#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>

namespace pxeboot {
    namespace ip {
        // An IPv4 address (with serializable interface).
        struct Addr {
            // Raw access to the underlying representation.
            u32 value;

            // Constructors.
            constexpr Addr()
                : value(0) {}
            constexpr Addr(u32 ip)  // NOLINT
                : value(ip) {}
            constexpr Addr(u8 a, u8 b, u8 c, u8 d)
                : value(16777216ul * a + 65536ul * b + 256ul * c + d) {}

            // Commonly used operators.
            constexpr bool operator==(const pxeboot::ip::Addr& other) const
                {return value == other.value;}
            constexpr bool operator!=(const pxeboot::ip::Addr& other) const
                {return value != other.value;}
            constexpr bool operator<(const pxeboot::ip::Addr& other) const
                {return value < other.value;}
            constexpr pxeboot::ip::Addr operator+(unsigned offset) const
                {return pxeboot::ip::Addr(value + (u32)offset);}
            inline void write_to(pxeboot::io::Writeable* wr) const
                {wr->write_u32(value);}
            inline bool read_from(pxeboot::io::Readable* rd) {
                if (rd->get_read_ready() < 4) return false;
                value = rd->read_u32(); return true;
            }

            // Log formatting.
            void log_to(pxeboot::log::LogBuffer& wr) const;

            // Tests for various reserved address ranges:
            bool is_broadcast() const;  // Limited broadcast (255.255.255.255)
            bool is_multicast() const;  // IP multicast (224.*.*.*)
            bool is_unicast() const;    // Any normal single-destination address
            bool is_valid() const;      // Any nonzero address
        };

        // CIDR "prefix" is the number of leading ones in the subnet mask.
        constexpr u32 cidr_prefix(unsigned npre) {
            return (npre ? ~((0x80000000 >> (npre-1)) - 1) : 0);
        }

        // IPv4 subnet masks share functionality with a basic address,
        // but are constructed differently to match common conventions.
        struct Mask : public pxeboot::ip::Addr {
            constexpr Mask()
                : Addr() {}
            constexpr Mask(unsigned npre)  // NOLINT
                : Addr(pxeboot::ip::cidr_prefix(npre)) {}
            constexpr Mask(u8 a, u8 b, u8 c, u8 d)
                : Addr(a, b, c, d) {}
            constexpr Mask(const pxeboot::ip::Addr& addr)  // NOLINT
                : Addr(addr.value) {}

            // Convert this subnet-mask to a CIDR prefix length.
            // (Undefined if this mask is not a valid CIDR subnet.)
            unsigned prefix() const;

            // Is this a valid CIDR mask? (i.e., Leading ones only.)
            bool is_contiguous() const;
        };

        // An IPv4 subnet consists of a base address and a subnet mask.
        struct Subnet {
            // Raw access to the underlying representation.
            pxeboot::ip::Addr addr;
            pxeboot::ip::Mask mask;

            // Does this subnet contain the given address?
            constexpr bool contains(const pxeboot::ip::Addr& other) const
                {return (addr.value & mask.value) == (other.value & mask.value);}

            // Directed broadcast address for this subnet.
            // e.g., 10.0.0.1 / 255.255.255.0 --> 10.0.0.255
            constexpr pxeboot::ip::Addr broadcast() const
                {return pxeboot::ip::Addr(addr.value | ~mask.value);}

            // Get the CIDR prefix length for this subnet.
            inline unsigned prefix() const
                {return mask.prefix();}

            // Log formatting.
            void log_to(pxeboot::log::LogBuffer& wr) const;
        };

        // Commonly used IP-addresses and other constants:
        constexpr pxeboot::ip::Addr ADDR_NONE   = 0;
        constexpr pxeboot::ip::Mask MASK_24     = 24;   // 192.168.0.*
        constexpr pxeboot::ip::Mask MASK_32     = 32;   // 192.168.0.123
        constexpr pxeboot::ip::Addr ADDR_BROADCAST
            = pxeboot::ip::Addr(255, 255, 255, 255);
        constexpr pxeboot::ip::Addr ADDR_LOOPBACK
            = pxeboot::ip::Addr(127, 0, 0, 1);

        // Parse dotted-quad notation (e.g., "10.0.0.1").
        // Returns false if the string is not a valid IPv4 address.
        bool parse_addr(const char* str, pxeboot::ip::Addr& out);
    }
}
