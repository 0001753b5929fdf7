//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the PxeBoot logging system

#include <cstring>
#include <deque>
#include <string>
#include <thread>
#include <vector>
#include <catch2/catch.hpp>
#include <hal_test/sim_utils.h>
#include <pxeboot/log.h>
#include <pxeboot/udp_core.h>

using pxeboot::log::Log;
static const s8 LOG_DEBUG       = pxeboot::log::DEBUG;
static const s8 LOG_INFO        = pxeboot::log::INFO;
static const s8 LOG_WARNING     = pxeboot::log::WARNING;
static const s8 LOG_ERROR       = pxeboot::log::ERROR;
static const s8 LOG_CRITICAL    = pxeboot::log::CRITICAL;

struct LogEvent {
    s8 priority;
    std::string msg;
};

const LogEvent MSG_A = {LOG_DEBUG,      "MsgA = 0x12"};
const LogEvent MSG_B = {LOG_INFO,       "MsgB = 0x1234"};
const LogEvent MSG_C = {LOG_WARNING,    "MsgC = 0x12345678"};
const LogEvent MSG_D = {LOG_ERROR,      "MsgD = 0x123456789ABCDEF0"};
const LogEvent MSG_E = {LOG_CRITICAL,   "MsgE: Test1234 = 1"};
const LogEvent MSG_F = {LOG_INFO,       "MsgF: Var1 = +0, Var2 = -2147483648, Var3 = 4294967295"};
const LogEvent MSG_G = {LOG_WARNING,    "MsgG = DE:AD:BE:EF:CA:FE = 192.168.1.42"};
const LogEvent MSG_H = {LOG_INFO,       "MsgH = 12345678901234567890"};
const LogEvent MSG_I = {LOG_INFO,       "DHCP: Reply to 10.0.0.255:68"};
const u8 MSG_D_BYTES[] = {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0};

// Helper class for storing each Log message in a queue, then cross-checking
// the queue contents against an expected reference priority/string.
class MockLog : public pxeboot::log::EventHandler {
public:
    void check_next(const LogEvent& ref) {
        REQUIRE_FALSE(m_queue.empty());
        CHECK(ref.priority == m_queue.front().priority);
        CHECK(ref.msg == m_queue.front().msg);
        CHECK(ref.msg.size() == strlen(m_queue.front().msg.c_str()));
        m_queue.pop_front();
    };

    unsigned count() const {return (unsigned)m_queue.size();}

    const std::deque<LogEvent>& queue() const {return m_queue;}

protected:
    // Called from any thread, so store the message and check it later.
    void log_event(s8 priority, unsigned nbytes, const char* msg) override {
        LogEvent tmp = {priority, std::string(msg, msg + nbytes)};
        m_queue.push_back(tmp);
    }
    std::deque<LogEvent> m_queue;
};

static const unsigned NMSG = 100;

TEST_CASE("log") {
    // Start the logging system.
    CHECK(pxeboot::log::pre_test_reset());
    MockLog log;

    SECTION("basic") {
        // Log a series of fixed messages.
        {Log(LOG_DEBUG,     "MsgA").write((u8)0x12);}
        {Log(LOG_INFO,      "MsgB").write((u16)0x1234);}
        {Log(LOG_WARNING,   "MsgC").write((u32)0x12345678);}
        {Log(LOG_ERROR,     "MsgD").write(MSG_D_BYTES, sizeof(MSG_D_BYTES));}
        {Log(LOG_CRITICAL,  "MsgE", "Test1234").write(true);}

        // Fixed message with a longer chain of writes.
        {Log(LOG_INFO,      "MsgF")
            .write(": Var1").write10((s32)0)
            .write(", Var2").write10((s32)INT32_MIN)
            .write(", Var3").write10((u32)UINT32_MAX);}

        // Address types and wide integers.
        const pxeboot::eth::MacAddr mac = {0xDE, 0xAD, 0xBE, 0xEF, 0xCA, 0xFE};
        {Log(LOG_WARNING,   "MsgG").write(mac).write(pxeboot::ip::Addr(192, 168, 1, 42));}
        {Log(LOG_INFO,      "MsgH").write10((u64)12345678901234567890ull);}

        // Objects with a log_to() method.
        const pxeboot::udp::Endpoint ep(
            pxeboot::ip::Addr(10, 0, 0, 255), pxeboot::udp::PORT_DHCP_CLIENT);
        {Log(LOG_INFO, "DHCP", "Reply to ").write_obj(ep);}

        // Check each message in the queue.
        log.check_next(MSG_A);
        log.check_next(MSG_B);
        log.check_next(MSG_C);
        log.check_next(MSG_D);
        log.check_next(MSG_E);
        log.check_next(MSG_F);
        log.check_next(MSG_G);
        log.check_next(MSG_H);
        log.check_next(MSG_I);
        CHECK(log.count() == 0);
    }

    SECTION("priority_label") {
        CHECK(std::string(pxeboot::log::priority_label(LOG_DEBUG)) == "Debug");
        CHECK(std::string(pxeboot::log::priority_label(LOG_INFO)) == "Info");
        CHECK(std::string(pxeboot::log::priority_label(LOG_WARNING)) == "Warn");
        CHECK(std::string(pxeboot::log::priority_label(LOG_ERROR)) == "Error");
        CHECK(std::string(pxeboot::log::priority_label(LOG_CRITICAL)) == "Crit");
    }

    SECTION("truncate") {
        // Very long messages are truncated to the maximum length.
        std::string big(2 * PXEBOOT_LOG_MAXLEN, 'x');
        {Log(LOG_INFO, big.c_str()).write(" tail");}
        REQUIRE(log.count() == 1);
        CHECK(log.queue().front().msg.size() == PXEBOOT_LOG_MAXLEN);
    }

    SECTION("fixed-length") {
        // The (ptr, len) constructor does not require a terminator.
        const char TEXT[] = {'A', 'B', 'C', 'D'};
        {Log(LOG_INFO, TEXT, 3);}
        REQUIRE(log.count() == 1);
        CHECK(log.queue().front().msg == "ABC");
    }

    SECTION("multiple") {
        // Every registered handler receives each message.
        MockLog log2;
        {Log(LOG_INFO, "MsgB").write((u16)0x1234);}
        log.check_next(MSG_B);
        log2.check_next(MSG_B);
    }

    SECTION("threads") {
        // Concurrent messages are delivered whole and never interleaved.
        const unsigned NTHREADS = 8;
        std::vector<std::thread> threads;
        for (unsigned t = 0 ; t < NTHREADS ; ++t) {
            threads.push_back(std::thread([t]() {
                for (unsigned n = 0 ; n < NMSG ; ++n)
                    Log(LOG_INFO, "Thread").write10(u32(t)).write(" msg").write10(u32(n));
            }));
        }
        for (auto& th : threads) th.join();
        REQUIRE(log.count() == NTHREADS * NMSG);
        for (const auto& evt : log.queue()) {
            CHECK(evt.msg.find("Thread = ") == 0);
            CHECK(evt.msg.find(" msg = ") != std::string::npos);
        }
    }
}

TEST_CASE("log-console") {
    PXEBOOT_TEST_START;

    SECTION("contains") {
        log.disable();
        Log(LOG_INFO, "TFTP", "Read request boot.efi");
        CHECK(log.contains("Read request"));
        CHECK_FALSE(log.contains("Write request"));
        log.clear();
        CHECK(log.empty());
    }

    SECTION("suppress") {
        // Suppressed messages are still stored for inspection.
        log.suppress("Noisy");
        Log(LOG_WARNING, "Noisy message");
        CHECK(log.contains("Noisy"));
        log.suppress(0);
    }

    SECTION("threshold") {
        log.m_threshold = LOG_ERROR;
        Log(LOG_DEBUG, "Hidden message");
        CHECK(log.contains("Hidden"));
    }
}
