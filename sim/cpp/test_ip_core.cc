//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Unit tests for address types defined in "ip_core.h", "eth_header.h",
// and "udp_core.h".

#include <catch2/catch.hpp>
#include <hal_test/sim_utils.h>
#include <pxeboot/eth_header.h>
#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>
#include <pxeboot/ip_core.h>
#include <pxeboot/udp_core.h>

using pxeboot::ip::Addr;
using pxeboot::ip::ADDR_BROADCAST;
using pxeboot::ip::ADDR_LOOPBACK;
using pxeboot::ip::ADDR_NONE;
using pxeboot::ip::Mask;
using pxeboot::ip::Subnet;

// Format any loggable object as a string.
template <class T> std::string log_str(const T& obj) {
    pxeboot::log::LogBuffer buff;
    obj.log_to(buff);
    return std::string(buff.c_str());
}

TEST_CASE("ip_addr") {
    PXEBOOT_TEST_START;
    const Addr ADDR_EXAMPLE(192, 168, 0, 1);
    const Addr ADDR_MULTICAST(224, 0, 0, 251);

    SECTION("is_broadcast") {
        CHECK(ADDR_BROADCAST.is_broadcast());
        CHECK_FALSE(ADDR_EXAMPLE.is_broadcast());
        CHECK_FALSE(ADDR_NONE.is_broadcast());
    }

    SECTION("is_multicast") {
        CHECK(ADDR_BROADCAST.is_multicast());
        CHECK(ADDR_MULTICAST.is_multicast());
        CHECK_FALSE(ADDR_EXAMPLE.is_multicast());
        CHECK_FALSE(ADDR_LOOPBACK.is_multicast());
    }

    SECTION("is_unicast") {
        CHECK(ADDR_EXAMPLE.is_unicast());
        CHECK(ADDR_LOOPBACK.is_unicast());
        CHECK_FALSE(ADDR_BROADCAST.is_unicast());
        CHECK_FALSE(ADDR_MULTICAST.is_unicast());
        CHECK_FALSE(ADDR_NONE.is_unicast());
    }

    SECTION("is_valid") {
        CHECK(ADDR_EXAMPLE.is_valid());
        CHECK_FALSE(ADDR_NONE.is_valid());
    }

    SECTION("arithmetic") {
        CHECK(ADDR_EXAMPLE + 1 == Addr(192, 168, 0, 2));
        CHECK(Addr(10, 0, 0, 255) + 1 == Addr(10, 0, 1, 0));
        CHECK(Addr(10, 0, 0, 1) < Addr(10, 0, 0, 2));
        CHECK_FALSE(Addr(10, 0, 1, 0) < Addr(10, 0, 0, 255));
    }

    SECTION("log_to") {
        CHECK(log_str(ADDR_EXAMPLE) == "192.168.0.1");
        CHECK(log_str(ADDR_BROADCAST) == "255.255.255.255");
        CHECK(log_str(ADDR_NONE) == "0.0.0.0");
    }

    SECTION("read_write") {
        u8 buff[4];
        pxeboot::io::ArrayWrite wr(buff, sizeof(buff));
        wr.write_obj(ADDR_EXAMPLE);
        CHECK(wr.write_finalize());
        CHECK(buff[0] == 192);
        CHECK(buff[3] == 1);
        Addr tmp;
        pxeboot::io::ArrayRead rd(buff, sizeof(buff));
        CHECK(rd.read_obj(tmp));
        CHECK(tmp == ADDR_EXAMPLE);
        CHECK_FALSE(rd.read_obj(tmp));
    }
}

TEST_CASE("ip_parse") {
    PXEBOOT_TEST_START;
    Addr tmp;

    SECTION("valid") {
        CHECK(pxeboot::ip::parse_addr("10.0.0.1", tmp));
        CHECK(tmp == Addr(10, 0, 0, 1));
        CHECK(pxeboot::ip::parse_addr("255.255.255.0", tmp));
        CHECK(tmp == Addr(255, 255, 255, 0));
        CHECK(pxeboot::ip::parse_addr("0.0.0.0", tmp));
        CHECK(tmp == ADDR_NONE);
    }

    SECTION("invalid") {
        tmp = ADDR_LOOPBACK;
        CHECK_FALSE(pxeboot::ip::parse_addr(0, tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("10.0.0", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("10.0.0.1.5", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("10.0.0.256", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("10.0.0.1000", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("10..0.1", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("10.0.0.1 ", tmp));
        CHECK_FALSE(pxeboot::ip::parse_addr("a.b.c.d", tmp));
        CHECK(tmp == ADDR_LOOPBACK);    // Unchanged on error
    }
}

TEST_CASE("ip_subnet") {
    PXEBOOT_TEST_START;

    SECTION("mask") {
        CHECK(pxeboot::ip::MASK_24 == Addr(255, 255, 255, 0));
        CHECK(pxeboot::ip::MASK_24.prefix() == 24);
        CHECK(pxeboot::ip::MASK_32.prefix() == 32);
        CHECK(Mask(255, 255, 0, 0).is_contiguous());
        CHECK(Mask(0u).is_contiguous());
        CHECK_FALSE(Mask(255, 0, 255, 0).is_contiguous());
    }

    SECTION("subnet") {
        const Subnet net = {Addr(10, 0, 0, 1), pxeboot::ip::MASK_24};
        CHECK(net.prefix() == 24);
        CHECK(net.broadcast() == Addr(10, 0, 0, 255));
        CHECK(net.contains(Addr(10, 0, 0, 200)));
        CHECK_FALSE(net.contains(Addr(10, 0, 1, 1)));
        CHECK(log_str(net) == "10.0.0.1 / 255.255.255.0");
    }

    SECTION("wide") {
        const Subnet net = {Addr(172, 16, 5, 1), Mask(255, 255, 240, 0)};
        CHECK(net.broadcast() == Addr(172, 16, 15, 255));
        CHECK(net.contains(Addr(172, 16, 0, 1)));
    }
}

TEST_CASE("eth_macaddr") {
    PXEBOOT_TEST_START;
    const pxeboot::eth::MacAddr MAC_A = {0xDE, 0xAD, 0xBE, 0xEF, 0x12, 0x34};
    const pxeboot::eth::MacAddr MAC_B = {0xDE, 0xAD, 0xBE, 0xEF, 0x12, 0x35};

    CHECK(log_str(MAC_A) == "DE:AD:BE:EF:12:34");
    CHECK(MAC_A.to_u64() == 0xDEADBEEF1234ull);
    CHECK(pxeboot::eth::MacAddr::from_u64(0xDEADBEEF1234ull) == MAC_A);
    CHECK(MAC_A < MAC_B);
    CHECK(MAC_A != MAC_B);
    CHECK_FALSE(MAC_B < MAC_A);
}

TEST_CASE("udp_endpoint") {
    PXEBOOT_TEST_START;
    const pxeboot::udp::Endpoint EP_A(Addr(10, 0, 0, 100), pxeboot::udp::PORT_DHCP_CLIENT);
    const pxeboot::udp::Endpoint EP_B(Addr(10, 0, 0, 100), pxeboot::udp::PORT_TFTP_SERVER);

    CHECK(log_str(EP_A) == "10.0.0.100:68");
    CHECK(EP_A != EP_B);
    CHECK(EP_A == pxeboot::udp::Endpoint(Addr(10, 0, 0, 100), 68));
    CHECK(pxeboot::udp::Endpoint().addr == ADDR_NONE);
}
