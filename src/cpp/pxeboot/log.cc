//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <mutex>
#include <pxeboot/eth_header.h>
#include <pxeboot/ip_core.h>
#include <pxeboot/log.h>
#include <pxeboot/utils.h>

namespace log = pxeboot::log;
using log::Log;
using log::LogBuffer;
using pxeboot::util::ListCore;

// Global pointer to a linked list of active destination objects, if any.
// The mutex guards the list and serializes delivery of each message.
static log::EventHandler* g_log_dst = 0;
static std::mutex g_log_mutex;

// Forcibly unregister any EventHandler objects.
bool log::pre_test_reset() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    bool ok = true;
    if (g_log_dst) {g_log_dst = 0; ok = false;}
    return ok;
}

// Longest decimal u64, plus sign and terminator.
static constexpr unsigned DEC_MAXLEN = 22;

const char* log::priority_label(s8 val) {
    if (val >= log::CRITICAL)
        return "Crit";
    else if (val >= log::ERROR)
        return "Error";
    else if (val >= log::WARNING)
        return "Warn";
    else if (val >= log::INFO)
        return "Info";
    else
        return "Debug";
}

log::EventHandler::EventHandler()
    : m_next(0)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    ListCore::add(g_log_dst, this);
}

log::EventHandler::~EventHandler() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    ListCore::remove(g_log_dst, this);
}

Log::Log(s8 priority, const char* str)
    : m_priority(priority)
{
    m_buff.wr_str(str);
}

Log::Log(s8 priority, const char* str1, const char* str2)
    : m_priority(priority)
{
    m_buff.wr_str(str1);
    m_buff.wr_str(": ");
    m_buff.wr_str(str2);
}

Log::Log(s8 priority, const void* str, unsigned nbytes)
    : m_priority(priority)
{
    m_buff.wr_fix((const char*)str, nbytes);
}

Log::~Log() {
    // Null-terminate the final message string.
    m_buff.terminate();

    // Deliver it to each handler on the global list.
    std::lock_guard<std::mutex> lock(g_log_mutex);
    log::EventHandler* dst = g_log_dst;
    while (dst) {
        dst->log_event(m_priority, m_buff.len(), m_buff.m_buff);
        dst = ListCore::next(dst);
    }
}

Log& Log::write(const char* str) {
    m_buff.wr_str(str);
    return *this;
}

Log& Log::write(bool val) {
    m_buff.wr_str(" = ");
    m_buff.wr_hex(val ? 1:0, 1);
    return *this;
}

Log& Log::write(u8 val) {
    m_buff.wr_str(" = 0x");
    m_buff.wr_hex(val, 2);
    return *this;
}

Log& Log::write(u16 val) {
    m_buff.wr_str(" = 0x");
    m_buff.wr_hex(val, 4);
    return *this;
}

Log& Log::write(u32 val) {
    m_buff.wr_str(" = 0x");
    m_buff.wr_hex(val, 8);
    return *this;
}

Log& Log::write(const u8* val, unsigned nbytes) {
    m_buff.wr_str(" = 0x");
    for (unsigned a = 0 ; a < nbytes ; ++a)
        m_buff.wr_hex(val[a], 2);
    return *this;
}

Log& Log::write(const pxeboot::eth::MacAddr& mac) {
    m_buff.wr_str(" = ");
    mac.log_to(m_buff);
    return *this;
}

Log& Log::write(const pxeboot::ip::Addr& ip) {
    m_buff.wr_str(" = ");
    ip.log_to(m_buff);
    return *this;
}

Log& Log::write10(s32 val) {
    m_buff.wr_str(" = ");
    m_buff.wr_sdec(val);
    return *this;
}

Log& Log::write10(u32 val) {
    m_buff.wr_str(" = ");
    m_buff.wr_dec(val);
    return *this;
}

Log& Log::write10(u64 val) {
    m_buff.wr_str(" = ");
    m_buff.wr_dec(val);
    return *this;
}

const char* LogBuffer::c_str() {
    terminate();
    return m_buff;
}

void LogBuffer::wr_fix(const char* str, unsigned len) {
    if (!str) return;  // Ignore null pointers
    const char* end = str + len;
    while (str != end && m_wridx < PXEBOOT_LOG_MAXLEN)
        m_buff[m_wridx++] = *(str++);
}

void LogBuffer::wr_str(const char* str) {
    if (!str) return;  // Ignore null pointers
    while (*str && m_wridx < PXEBOOT_LOG_MAXLEN)
        m_buff[m_wridx++] = *(str++);
}

void LogBuffer::wr_hex(u32 val, unsigned ndigits) {
    static const char HEX[] = "0123456789ABCDEF";
    while (ndigits && m_wridx < PXEBOOT_LOG_MAXLEN) {
        --ndigits;
        m_buff[m_wridx++] = HEX[(val >> (4 * ndigits)) & 0xF];
    }
}

void LogBuffer::wr_dec(u64 val) {
    // Fill the scratch buffer from the right.
    char temp[DEC_MAXLEN];
    char* ptr = temp + DEC_MAXLEN;
    *(--ptr) = 0;
    do {
        *(--ptr) = char('0' + val % 10);
        val /= 10;
    } while (val);
    wr_str(ptr);
}

void LogBuffer::wr_sdec(s32 val) {
    wr_str(val < 0 ? "-" : "+");
    wr_dec(pxeboot::util::abs_s32(val));
}
