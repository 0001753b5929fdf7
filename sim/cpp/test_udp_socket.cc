//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for the POSIX UDP socket wrapper

#include <cstring>
#include <vector>
#include <catch2/catch.hpp>
#include <hal_posix/posix_utils.h>
#include <hal_posix/udp_socket.h>
#include <hal_test/sim_utils.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <unistd.h>

namespace udp = pxeboot::udp;
using pxeboot::ip::ADDR_LOOPBACK;
using pxeboot::udp::Endpoint;
using pxeboot::udp::SocketPosix;

TEST_CASE("udp_socket") {
    PXEBOOT_TEST_START;

    SocketPosix a, b;
    REQUIRE(a.bind(udp::PORT_NONE, ADDR_LOOPBACK));
    REQUIRE(b.bind(udp::PORT_NONE, ADDR_LOOPBACK));

    SECTION("ephemeral") {
        CHECK(a.is_open());
        CHECK(a.local_port() != udp::PORT_NONE);
        CHECK(a.local_port() != b.local_port());
    }

    SECTION("send_recv") {
        const char MSG[] = "Hello, world";
        CHECK(a.send(Endpoint(ADDR_LOOPBACK, b.local_port()), MSG, sizeof(MSG)));
        Endpoint src;
        char buff[64];
        int len = b.recv(src, buff, sizeof(buff), 1000);
        REQUIRE(len == int(sizeof(MSG)));
        CHECK(strcmp(buff, MSG) == 0);
        CHECK(src == Endpoint(ADDR_LOOPBACK, a.local_port()));
    }

    SECTION("truncate") {
        // Oversize datagrams are cut to fit the buffer.
        const char MSG[] = "0123456789";
        CHECK(a.send(Endpoint(ADDR_LOOPBACK, b.local_port()), MSG, 10));
        Endpoint src;
        char buff[4];
        CHECK(b.recv(src, buff, sizeof(buff), 1000) == 4);
        CHECK(buff[3] == '3');
    }

    SECTION("timeout") {
        Endpoint src;
        u8 buff[16];
        pxeboot::util::PosixTimer timer;
        CHECK(b.recv(src, buff, sizeof(buff), 50) == udp::RECV_TIMEOUT);
        CHECK(timer.elapsed_msec() >= 40);
    }

    SECTION("closed") {
        log.suppress("SocketPosix");
        b.close();
        CHECK_FALSE(b.is_open());
        CHECK(b.local_port() == udp::PORT_NONE);
        Endpoint src;
        u8 buff[16];
        CHECK(b.recv(src, buff, sizeof(buff), 10) == udp::RECV_ERROR);
        CHECK_FALSE(b.send(Endpoint(ADDR_LOOPBACK, a.local_port()), buff, 4));
    }

    SECTION("rebind") {
        // Re-binding closes the previous socket first.
        REQUIRE(a.bind(udp::PORT_NONE, ADDR_LOOPBACK));
        CHECK(a.is_open());
        CHECK(a.local_port() != udp::PORT_NONE);
    }

    SECTION("broadcast") {
        CHECK(a.set_broadcast(true));
        CHECK(a.set_broadcast(false));
    }
}

TEST_CASE("udp_socket_high_fd") {
    PXEBOOT_TEST_START;

    // Occupy every descriptor below FD_SETSIZE and then some, so the
    // socket created afterwards gets a large descriptor number.
    const int FD_TARGET = 1100;
    rlimit lim;
    REQUIRE(getrlimit(RLIMIT_NOFILE, &lim) == 0);
    if (lim.rlim_cur < rlim_t(FD_TARGET + 64)) {
        lim.rlim_cur = (lim.rlim_max == RLIM_INFINITY)
            ? rlim_t(FD_TARGET + 64) : lim.rlim_max;
        setrlimit(RLIMIT_NOFILE, &lim);
        REQUIRE(getrlimit(RLIMIT_NOFILE, &lim) == 0);
    }
    if (lim.rlim_cur < rlim_t(FD_TARGET + 64)) {
        WARN("Descriptor limit too low, skipping.");
        return;
    }

    std::vector<int> spare;
    int fd = -1;
    while (fd < FD_TARGET) {
        fd = open("/dev/null", O_RDONLY);
        REQUIRE(fd >= 0);
        spare.push_back(fd);
    }

    {
        SocketPosix a, b;
        REQUIRE(a.bind(udp::PORT_NONE, ADDR_LOOPBACK));
        REQUIRE(b.bind(udp::PORT_NONE, ADDR_LOOPBACK));

        // Nothing queued: wait for the timeout.
        Endpoint src;
        u8 buff[16];
        CHECK(b.recv(src, buff, sizeof(buff), 10) == udp::RECV_TIMEOUT);

        // Normal delivery.
        const char MSG[] = "high";
        CHECK(a.send(Endpoint(ADDR_LOOPBACK, b.local_port()), MSG, sizeof(MSG)));
        int len = b.recv(src, buff, sizeof(buff), 1000);
        CHECK(len == int(sizeof(MSG)));
        CHECK(src == Endpoint(ADDR_LOOPBACK, a.local_port()));
    }

    for (int x : spare) ::close(x);
}

TEST_CASE("iface_exists") {
    PXEBOOT_TEST_START;
    CHECK(udp::iface_exists("lo"));
    CHECK_FALSE(udp::iface_exists("no-such-iface0"));
    CHECK_FALSE(udp::iface_exists(""));
    CHECK_FALSE(udp::iface_exists(0));
}
