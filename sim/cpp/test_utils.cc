//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for miscellaneous utility functions

#include <cstring>
#include <catch2/catch.hpp>
#include <hal_test/sim_utils.h>
#include <pxeboot/list.h>
#include <pxeboot/utils.h>

namespace util = pxeboot::util;

// Minimal linked-list item.
struct ListItem {
    explicit ListItem(int v) : value(v), m_next(0) {}
    int value;
    ListItem* m_next;
};

TEST_CASE("utils") {
    PXEBOOT_TEST_START;

    SECTION("min_max") {
        CHECK(util::min_u32(3, 7) == 3);
        CHECK(util::min_unsigned(9, 7) == 7);
        CHECK(util::max_unsigned(9, 7) == 9);
    }

    SECTION("abs_s32") {
        CHECK(util::abs_s32(0) == 0);
        CHECK(util::abs_s32(-5) == 5);
        CHECK(util::abs_s32(INT32_MAX) == 2147483647u);
        CHECK(util::abs_s32(INT32_MIN) == 2147483648u);
    }

    SECTION("popcount") {
        CHECK(util::popcount(0) == 0);
        CHECK(util::popcount(0xFFFFFF00u) == 24);
        CHECK(util::popcount(0xFFFFFFFFu) == 32);
    }

    SECTION("big_endian") {
        u8 buff[4];
        util::write_be_u32(buff, 0x12345678u);
        CHECK(buff[0] == 0x12);
        CHECK(buff[3] == 0x78);
        CHECK(util::extract_be_u32(buff) == 0x12345678u);
        util::write_be_u16(buff, 0xABCD);
        CHECK(util::extract_be_u16(buff) == 0xABCD);
    }

    SECTION("copy_field") {
        u8 field[8];
        memset(field, 0xFF, sizeof(field));
        CHECK(util::copy_field(field, sizeof(field), "abc"));
        CHECK(std::string((const char*)field) == "abc");
        CHECK(field[7] == 0);
        // Longest string that fits leaves room for the terminator.
        CHECK(util::copy_field(field, sizeof(field), "1234567"));
        CHECK(field[7] == 0);
        CHECK_FALSE(util::copy_field(field, sizeof(field), "12345678"));
        CHECK(std::string((const char*)field) == "1234567");
        // Null input clears the field.
        CHECK(util::copy_field(field, sizeof(field), 0));
        CHECK(field[0] == 0);
    }
}

TEST_CASE("ListCore") {
    PXEBOOT_TEST_START;

    ListItem a(1), b(2), c(3);
    ListItem* head = 0;

    util::ListCore::add(head, &a);
    util::ListCore::add(head, &b);
    util::ListCore::add(head, &c);
    CHECK(util::ListCore::len(head) == 3);
    CHECK(util::ListCore::contains(head, &b));

    util::ListCore::remove(head, &b);
    CHECK(util::ListCore::len(head) == 2);
    CHECK_FALSE(util::ListCore::contains(head, &b));

    // Newest item is at the front of the list.
    CHECK(head == &c);
    CHECK(util::ListCore::next(head) == &a);
    CHECK(util::ListCore::next(&a) == 0);
}
