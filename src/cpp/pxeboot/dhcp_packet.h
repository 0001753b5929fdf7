//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! In-memory representation of a BOOTP/DHCP datagram
//!
//!\details
//! The fixed 236-byte BOOTP header is followed by the four-byte "magic
//! cookie" and a tag-length-value option stream (IETF RFC 2131 and 2132):
//!  https://datatracker.ietf.org/doc/html/rfc2131
//!  https://datatracker.ietf.org/doc/html/rfc2132
//!
//! Decoding is best-effort: options are parsed only if the magic cookie is
//! present, and a truncated option at the end of the datagram simply ends
//! the option list.  Encoding always emits the cookie and the end-of-options
//! tag, pads the result to the 300-byte BOOTP minimum, and overflows if the
//! result would exceed the 576-byte datagram that every client must accept.

#pragma once

#include <map>
#include <vector>
#include <pxeboot/eth_header.h>
#include <pxeboot/ip_core.h>

namespace pxeboot {
    namespace ip {
        // BOOTP opcodes.
        constexpr u8 DHCP_OP_REQUEST        = 1;
        constexpr u8 DHCP_OP_REPLY          = 2;

        // DHCP message types for use with DHCP_OPTION_MSG_TYPE.
        constexpr u8 DHCP_DISCOVER          = 1;    // Client to server
        constexpr u8 DHCP_OFFER             = 2;    // Server to client
        constexpr u8 DHCP_REQUEST           = 3;    // Client to server
        constexpr u8 DHCP_ACK               = 5;    // Server to client
        constexpr u8 DHCP_NAK               = 6;    // Server to client

        // DHCP option tags (RFC 2132 and RFC 4578).
        constexpr u8 DHCP_OPTION_PAD        = 0;    // No length
        constexpr u8 DHCP_OPTION_SUBNET_MASK = 1;
        constexpr u8 DHCP_OPTION_ROUTER     = 3;
        constexpr u8 DHCP_OPTION_DNS_SERVER = 6;
        constexpr u8 DHCP_OPTION_BROADCAST  = 28;
        constexpr u8 DHCP_OPTION_REQUEST_IP = 50;
        constexpr u8 DHCP_OPTION_LEASE_TIME = 51;
        constexpr u8 DHCP_OPTION_MSG_TYPE   = 53;
        constexpr u8 DHCP_OPTION_SERVER_IP  = 54;
        constexpr u8 DHCP_OPTION_TFTP_SERVER = 66;
        constexpr u8 DHCP_OPTION_BOOT_FILE  = 67;
        constexpr u8 DHCP_OPTION_CLIENT_ARCH = 93;
        constexpr u8 DHCP_OPTION_END        = 255;  // No length

        // Wire-format constants.
        constexpr u32 DHCP_MAGIC            = 0x63825363;   // 99.130.83.99
        constexpr unsigned DHCP_HEADER_BYTES = 240;     // Including cookie
        constexpr unsigned DHCP_MIN_BYTES   = 300;      // BOOTP minimum
        constexpr unsigned DHCP_MAX_BYTES   = 576;      // Maximum reply
        constexpr unsigned DHCP_CHADDR_LEN  = 16;
        constexpr unsigned DHCP_SNAME_LEN   = 64;
        constexpr unsigned DHCP_FILE_LEN    = 128;
        constexpr unsigned DHCP_OPTION_MAXLEN = 255;

        //! One BOOTP/DHCP datagram.
        //! Options are stored as raw bytes keyed by tag; each tag appears
        //! at most once and encoding order is ascending by tag.
        class DhcpPacket {
        public:
            //! Constructor creates an empty packet with zeroed fields.
            DhcpPacket();

            //! Parse a received datagram.
            //! \returns False if the input is shorter than the fixed
            //! 240-byte header region.  Otherwise the fixed fields are
            //! copied and any valid options are loaded.
            bool read_from(pxeboot::io::Readable* rd);

            //! Serialize this packet, including cookie, options, END tag,
            //! and zero-padding up to DHCP_MIN_BYTES.  If the destination
            //! is too small, it records the overflow; the caller MUST check
            //! the result of `write_finalize()`.
            void write_to(pxeboot::io::Writeable* wr) const;

            //! Total length produced by write_to(), including padding.
            unsigned encoded_len() const;

            //! Store an option value, replacing any previous value.
            //! Returns false if the value is too long (>255 bytes).
            //!@{
            bool set_option(u8 tag, const void* data, unsigned len);
            bool set_option_u8(u8 tag, u8 value);
            bool set_option_u32(u8 tag, u32 value);
            bool set_option_addr(u8 tag, const pxeboot::ip::Addr& addr);
            bool set_option_str(u8 tag, const char* str);
            //!@}

            //! Look up an option value.  Returns null if absent.
            const std::vector<u8>* option(u8 tag) const;

            //! Read a fixed-size option value.
            //! Returns false if the option is absent or too short.
            //!@{
            bool option_u16(u8 tag, u16& value) const;
            bool option_addr(u8 tag, pxeboot::ip::Addr& addr) const;
            //!@}

            //! DHCP message type (option 53), or zero if absent.
            u8 message_type() const;

            //! Number of options currently stored.
            inline unsigned option_count() const
                {return (unsigned)m_options.size();}

            //! Read-only access to the full option map.
            inline const std::map<u8, std::vector<u8>>& options() const
                {return m_options;}

            //! Fixed header fields.
            //!@{
            u8 op;                  // BOOTREQUEST or BOOTREPLY
            u8 htype;               // Hardware type (1 = Ethernet)
            u8 hlen;                // Hardware address length
            u8 hops;                // Relay hop count
            u32 xid;                // Transaction ID
            u16 secs;               // Seconds since client began
            u16 flags;              // Broadcast flag, etc.
            pxeboot::ip::Addr ciaddr;   // Client address
            pxeboot::ip::Addr yiaddr;   // "Your" (assigned) address
            pxeboot::ip::Addr siaddr;   // Next server address
            pxeboot::ip::Addr giaddr;   // Relay agent address
            pxeboot::eth::MacAddr chaddr;   // Client hardware address
            u8 sname[DHCP_SNAME_LEN];   // Server name (null-padded)
            u8 file[DHCP_FILE_LEN];     // Boot filename (null-padded)
            //!@}

        protected:
            std::map<u8, std::vector<u8>> m_options;
        };
    }
}
