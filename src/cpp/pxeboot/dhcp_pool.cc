//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <pxeboot/dhcp_pool.h>
#include <pxeboot/log.h>

using pxeboot::eth::MacAddr;
using pxeboot::ip::Addr;
using pxeboot::ip::ADDR_NONE;
using pxeboot::ip::DhcpPool;

// Shortcut for acquiring the pool lock.
typedef std::lock_guard<std::mutex> PoolLock;

DhcpPool::DhcpPool(const Addr& first, const Addr& last)
    : m_first(first)
    , m_last(last)
    , m_next(first)
    , m_full(last < first)
{
    // Nothing else to initialize.
}

Addr DhcpPool::allocate(const MacAddr& client)
{
    PoolLock lock(m_mutex);

    // Existing lease?
    auto it = m_leases.find(client);
    if (it != m_leases.end()) return it->second;

    // Range exhausted?
    if (m_full) {
        Log(log::WARNING, "DHCP", "Address range exhausted")
            .write(client).write10((u32)m_leases.size());
        return ADDR_NONE;
    }

    // Assign the next address and advance the cursor.
    Addr addr = m_next;
    m_leases[client] = addr;
    if (m_next == m_last) {
        m_full = true;
    } else {
        m_next = m_next + 1;
    }
    return addr;
}

Addr DhcpPool::lookup(const MacAddr& client) const
{
    PoolLock lock(m_mutex);
    auto it = m_leases.find(client);
    return (it == m_leases.end()) ? ADDR_NONE : it->second;
}

void DhcpPool::count_leases(unsigned& free, unsigned& taken) const
{
    PoolLock lock(m_mutex);
    taken = (unsigned)m_leases.size();
    if (m_full) {
        free = 0;
    } else {
        free = m_last.value - m_next.value + 1;
    }
}

bool DhcpPool::contains(const Addr& addr) const
{
    return (m_first.value <= addr.value) && (addr.value <= m_last.value);
}
