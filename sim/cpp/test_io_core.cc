//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the Readable and Writeable interfaces

#include <cstring>
#include <catch2/catch.hpp>
#include <hal_test/sim_utils.h>
#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>

using pxeboot::io::ArrayRead;
using pxeboot::io::ArrayWrite;

TEST_CASE("ArrayRead") {
    PXEBOOT_TEST_START;

    const u8 DATA[] = {
        0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE,
        'H', 'i', 0, 'Y', 'o'};
    ArrayRead uut(DATA, sizeof(DATA));

    SECTION("integers") {
        CHECK(uut.get_read_ready() == sizeof(DATA));
        CHECK(uut.read_u8() == 0x12);
        CHECK(uut.read_u16() == 0x3456);
        CHECK(uut.read_u32() == 0x789ABCDEu);
        CHECK(uut.read_pos() == 7);
        CHECK(uut.get_read_ready() == 5);
    }

    SECTION("strings") {
        char str[8];
        CHECK(uut.read_consume(7));
        CHECK(uut.read_str(sizeof(str), str) == 2);
        CHECK(std::string(str) == "Hi");
        // Unterminated string ends at end-of-input.
        CHECK(uut.read_str(sizeof(str), str) == 2);
        CHECK(std::string(str) == "Yo");
        CHECK(uut.get_read_ready() == 0);
    }

    SECTION("truncate") {
        // Strings longer than the buffer are truncated but fully consumed.
        char str[2];
        CHECK(uut.read_consume(7));
        CHECK(uut.read_str(sizeof(str), str) == 1);
        CHECK(std::string(str) == "H");
        CHECK(uut.read_u8() == 'Y');
    }

    SECTION("underflow") {
        u8 tmp[16];
        CHECK_FALSE(uut.read_bytes(sizeof(tmp), tmp));
        CHECK_FALSE(uut.read_consume(sizeof(DATA) + 1));
        CHECK(uut.get_read_ready() == sizeof(DATA));
        CHECK(uut.read_consume(sizeof(DATA) - 1));
        CHECK(uut.read_u16() == 0);     // Underflow returns zero
        CHECK(uut.read_u8() == 'o');
    }

    SECTION("reset") {
        uut.read_finalize();
        CHECK(uut.get_read_ready() == 0);
        uut.read_reset(3);
        CHECK(uut.get_read_ready() == 3);
        CHECK(uut.read_u8() == 0x12);
    }
}

TEST_CASE("ArrayWrite") {
    PXEBOOT_TEST_START;

    u8 buff[8];
    ArrayWrite uut(buff, sizeof(buff));

    SECTION("integers") {
        uut.write_u8(0x12);
        uut.write_u16(0x3456);
        uut.write_u32(0x789ABCDEu);
        CHECK(uut.written_pos() == 7);
        CHECK(uut.get_write_space() == 1);
        CHECK(uut.write_finalize());
        CHECK(uut.written_len() == 7);
        const u8 REF[] = {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE};
        CHECK(memcmp(buff, REF, sizeof(REF)) == 0);
    }

    SECTION("strings") {
        uut.write_str("Hello");
        CHECK(uut.write_finalize());
        CHECK(uut.written_len() == 5);
        CHECK(memcmp(uut.buffer(), "Hello", 5) == 0);
    }

    SECTION("overflow") {
        // Overflow is reported at write_finalize().
        uut.write_str("Hello");
        uut.write_u32(0);
        CHECK_FALSE(uut.write_finalize());
        CHECK(uut.written_len() == 0);
        // The next frame starts fresh.
        uut.write_u32(0x12345678u);
        CHECK(uut.write_finalize());
        CHECK(uut.written_len() == 4);
    }

    SECTION("abort") {
        uut.write_str("Hello");
        uut.write_u32(0);
        uut.write_abort();
        uut.write_u16(0x1234);
        CHECK(uut.write_finalize());
        CHECK(uut.written_len() == 2);
    }
}
