//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Address pool for the DHCP server
//!
//!\details
//! The pool hands out consecutive addresses from a fixed range, one per
//! client hardware address.  Leases never expire: once a client has been
//! assigned an address, every later request from that client returns the
//! same address for the lifetime of the process.
//!
//! All methods are thread-safe.  Lookup, allocation, and cursor advance
//! for a given call happen under a single lock, so concurrent requests
//! from the same client always agree on the assigned address.

#pragma once

#include <map>
#include <mutex>
#include <pxeboot/eth_header.h>
#include <pxeboot/ip_core.h>

namespace pxeboot {
    namespace ip {
        //! Fixed-range address pool with process-lifetime leases.
        class DhcpPool {
        public:
            //! Create a pool spanning "first" through "last", inclusive.
            //! If last < first, the pool is empty.
            DhcpPool(const pxeboot::ip::Addr& first, const pxeboot::ip::Addr& last);

            //! Get the address assigned to this client, assigning the next
            //! free address on first contact.
            //! \returns The assigned address, or ADDR_NONE if the client
            //!     has no lease and the range is exhausted.
            pxeboot::ip::Addr allocate(const pxeboot::eth::MacAddr& client);

            //! Get the address assigned to this client without allocating.
            //! \returns The assigned address, or ADDR_NONE.
            pxeboot::ip::Addr lookup(const pxeboot::eth::MacAddr& client) const;

            //! Count free and assigned addresses.
            void count_leases(unsigned& free, unsigned& taken) const;

            //! Is the designated address inside this pool's range?
            bool contains(const pxeboot::ip::Addr& addr) const;

            //! Accessors for the configured range.
            //!@{
            inline pxeboot::ip::Addr first() const {return m_first;}
            inline pxeboot::ip::Addr last() const {return m_last;}
            //!@}

        protected:
            // Mutex protects all of the following state.
            mutable std::mutex m_mutex;

            // Configured range (inclusive).
            const pxeboot::ip::Addr m_first;
            const pxeboot::ip::Addr m_last;

            // Allocation cursor never passes m_last; once the final
            // address is assigned, the "full" flag is set instead.
            pxeboot::ip::Addr m_next;
            bool m_full;

            // Lease table, keyed by client hardware address.
            std::map<pxeboot::eth::MacAddr, pxeboot::ip::Addr> m_leases;
        };
    }
}
