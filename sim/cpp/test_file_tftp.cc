//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Test cases for file I/O and the file-backed TFTP server

#include <memory>
#include <thread>
#include <catch2/catch.hpp>
#include <hal_posix/file_io.h>
#include <hal_posix/file_tftp.h>
#include <hal_posix/posix_utils.h>
#include <hal_posix/udp_socket.h>
#include <hal_test/sim_utils.h>

namespace udp = pxeboot::udp;
using pxeboot::io::FileReader;
using pxeboot::io::FileWriter;
using pxeboot::ip::ADDR_LOOPBACK;
using pxeboot::udp::Endpoint;
using pxeboot::udp::SocketPosix;

// Expose the protected file and socket hooks.
class FileServer : public pxeboot::udp::TftpServerPosix {
public:
    FileServer(pxeboot::udp::Socket* sock, const char* root)
        : TftpServerPosix(sock, root) {}
    using pxeboot::udp::TftpServerPosix::read;
    using pxeboot::udp::TftpServerPosix::open_socket;
};

TEST_CASE("file_io") {
    PXEBOOT_TEST_START;

    const std::string folder = pxeboot::test::sim_folder("file_io");
    REQUIRE(!folder.empty());
    const std::string path = folder + "/test.bin";

    SECTION("write_read") {
        FileWriter wr(path.c_str());
        REQUIRE(wr.is_open());
        wr.write_u32(0x12345678u);
        wr.write_str("Hello");
        CHECK(wr.write_finalize());
        wr.close();

        FileReader rd(path.c_str());
        REQUIRE(rd.is_open());
        CHECK(rd.remaining() == 9);
        CHECK(rd.get_read_ready() == 9);
        CHECK(rd.read_u32() == 0x12345678u);
        CHECK(rd.read_consume(1));
        CHECK(pxeboot::io::read_str(&rd) == "ello");
        CHECK_FALSE(rd.is_open());
    }

    SECTION("empty") {
        CHECK(pxeboot::test::write_file(path, ""));
        FileReader rd(path.c_str());
        CHECK(rd.is_open());
        CHECK(rd.get_read_ready() == 0);
    }

    SECTION("underflow") {
        CHECK(pxeboot::test::write_file(path, "abc"));
        FileReader rd(path.c_str());
        u8 buff[8];
        CHECK_FALSE(rd.read_bytes(4, buff));
        CHECK(rd.read_bytes(3, buff));
        CHECK(buff[0] == 'a');
        CHECK_FALSE(rd.read_consume(1));
    }

    SECTION("missing") {
        FileReader rd;
        CHECK_FALSE(rd.open((folder + "/missing.bin").c_str()));
        CHECK_FALSE(rd.is_open());
        CHECK(rd.get_read_ready() == 0);
        FileWriter wr;
        CHECK_FALSE(wr.is_open());
        CHECK_FALSE(wr.write_finalize());
    }
}

TEST_CASE("file_tftp") {
    PXEBOOT_TEST_START;

    // Populate a scratch root folder.
    const std::string root = pxeboot::test::sim_folder("file_tftp");
    REQUIRE(!root.empty());
    const std::string BOOT = pxeboot::test::random_string(1300);
    const std::string CFG = "DEFAULT linux\n";
    REQUIRE(pxeboot::util::make_folder((root + "/pxelinux.cfg").c_str()));
    REQUIRE(pxeboot::test::write_file(root + "/bootx64.efi", BOOT));
    REQUIRE(pxeboot::test::write_file(root + "/pxelinux.cfg/default", CFG));

    SECTION("root_folder") {
        pxeboot::test::MockSocket sock(udp::PORT_TFTP_SERVER);
        FileServer a(&sock, root.c_str());
        FileServer b(&sock, (root + "/").c_str());
        CHECK(a.root_folder() == root + "/");
        CHECK(b.root_folder() == root + "/");
    }

    SECTION("read") {
        pxeboot::test::MockSocket sock(udp::PORT_TFTP_SERVER);
        FileServer uut(&sock, root.c_str());
        std::unique_ptr<pxeboot::io::Readable> rd(uut.read("bootx64.efi"));
        REQUIRE(rd);
        CHECK(pxeboot::io::read_str(rd.get()) == BOOT);
        rd.reset(uut.read("pxelinux.cfg/default"));
        REQUIRE(rd);
        CHECK(pxeboot::io::read_str(rd.get()) == CFG);
    }

    SECTION("not_found") {
        // Missing files and folders both read as "not found".
        pxeboot::test::MockSocket sock(udp::PORT_TFTP_SERVER);
        FileServer uut(&sock, root.c_str());
        CHECK(uut.read("missing.efi") == nullptr);
        CHECK(uut.read("pxelinux.cfg") == nullptr);
    }

    SECTION("open_socket") {
        pxeboot::test::MockSocket sock(udp::PORT_TFTP_SERVER);
        FileServer uut(&sock, root.c_str());
        std::unique_ptr<udp::Socket> a(uut.open_socket());
        std::unique_ptr<udp::Socket> b(uut.open_socket());
        REQUIRE(a);
        REQUIRE(b);
        CHECK(a->local_port() != udp::PORT_NONE);
        CHECK(a->local_port() != b->local_port());
    }

    SECTION("loopback") {
        // Full transfer over real sockets.
        log.suppress("TFTP");
        SocketPosix listen;
        REQUIRE(listen.bind(udp::PORT_NONE, ADDR_LOOPBACK));
        FileServer uut(&listen, root.c_str());
        std::thread server(&FileServer::serve, &uut);

        SocketPosix client;
        REQUIRE(client.bind(udp::PORT_NONE, ADDR_LOOPBACK));
        std::vector<u8> rrq = pxeboot::test::tftp_rrq("/bootx64.efi");
        CHECK(client.send(Endpoint(ADDR_LOOPBACK, listen.local_port()),
            rrq.data(), unsigned(rrq.size())));

        // Acknowledge each block until the final short block.
        std::string rcvd;
        Endpoint xfer_src;
        u8 buff[udp::TFTP_MAX_PACKET];
        for (unsigned block = 1 ; block < 10 ; ++block) {
            int len = client.recv(xfer_src, buff, sizeof(buff), 2000);
            REQUIRE(len >= 4);
            std::vector<u8> pkt(buff, buff + len);
            REQUIRE(pxeboot::test::tftp_opcode(pkt) == udp::TFTP_OPCODE_DATA);
            REQUIRE(pxeboot::test::tftp_block(pkt) == block);
            CHECK(xfer_src.port != listen.local_port());
            rcvd += pxeboot::test::tftp_payload(pkt);
            std::vector<u8> ack = pxeboot::test::tftp_ack(u16(block));
            CHECK(client.send(xfer_src, ack.data(), unsigned(ack.size())));
            if (len < int(udp::TFTP_MAX_PACKET)) break;
        }
        CHECK(rcvd == BOOT);

        // Allow the transfer thread to finish, then shut down.
        pxeboot::util::sleep_msec(100);
        uut.stop();
        server.join();
    }

    SECTION("loopback_missing") {
        log.suppress("TFTP");
        SocketPosix listen;
        REQUIRE(listen.bind(udp::PORT_NONE, ADDR_LOOPBACK));
        FileServer uut(&listen, root.c_str());
        std::thread server(&FileServer::serve, &uut);

        SocketPosix client;
        REQUIRE(client.bind(udp::PORT_NONE, ADDR_LOOPBACK));
        std::vector<u8> rrq = pxeboot::test::tftp_rrq("missing.efi");
        CHECK(client.send(Endpoint(ADDR_LOOPBACK, listen.local_port()),
            rrq.data(), unsigned(rrq.size())));

        Endpoint src;
        u8 buff[udp::TFTP_MAX_PACKET];
        int len = client.recv(src, buff, sizeof(buff), 2000);
        REQUIRE(len >= 4);
        std::vector<u8> pkt(buff, buff + len);
        CHECK(pxeboot::test::tftp_opcode(pkt) == udp::TFTP_OPCODE_ERROR);
        CHECK(pxeboot::test::tftp_block(pkt) == udp::TFTP_ERROR_NOFILE);

        pxeboot::util::sleep_msec(100);
        uut.stop();
        server.join();
    }
}
