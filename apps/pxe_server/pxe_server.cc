//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
// Console application providing DHCP and TFTP services for PXE boot
//
// The application binds the DHCP and TFTP ports, serves requests from
// background threads, and runs until the user hits Ctrl+C.  Binding to
// ports 67 and 69 usually requires elevated privileges.

#include <csignal>
#include <iostream>
#include <thread>
#include <unistd.h>
#include <hal_posix/file_tftp.h>
#include <hal_posix/posix_utils.h>
#include <hal_posix/pxe_config.h>
#include <hal_posix/udp_socket.h>
#include <pxeboot/dhcp_pool.h>
#include <pxeboot/ip_dhcp.h>

using namespace pxeboot;

// Global background services.
log::ToConsole logger;          // Print Log messages to console

// Create a folder if it does not already exist.
static bool bootstrap_folder(const std::string& path)
{
    if (util::make_folder(path.c_str())) return true;
    Log(log::ERROR, "Unable to create folder ").write(path.c_str());
    return false;
}

int main(int argc, const char* argv[])
{
    // Parse command-line arguments.
    Config cfg;
    int rc = parse_args(argc, argv, cfg);
    if (rc == PARSE_HELP) return 0;
    if (rc != PARSE_OK) return 2;
    if (!cfg.validate()) return 2;

    // Print the configuration banner.
    cfg.print(std::cout);
    std::cout << std::endl;

    // Sanity checks on the local environment.
    if (!udp::iface_exists(cfg.iface.c_str())) {
        Log(log::ERROR, "Interface not found ").write(cfg.iface.c_str());
        return 1;
    }
    if (!bootstrap_folder(cfg.tftp_root)) return 1;
    if (!bootstrap_folder(cfg.http_root)) return 1;

    // Block shutdown signals before starting any threads, so that
    // only the main thread receives them.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, 0);

    // DHCP replies are broadcast on the designated interface.
    udp::SocketPosix dhcp_sock;
    if (!dhcp_sock.bind(cfg.dhcp_port)) {
        Log(log::ERROR, "Unable to bind DHCP port").write10(cfg.dhcp_port.value);
        return 1;
    }
    if (!dhcp_sock.set_broadcast(true)) return 1;
    if (!dhcp_sock.bind_device(cfg.iface.c_str()))
        Log(log::WARNING, "DHCP socket not bound to interface ").write(cfg.iface.c_str());

    udp::SocketPosix tftp_sock;
    if (!tftp_sock.bind(cfg.tftp_port)) {
        Log(log::ERROR, "Unable to bind TFTP port").write10(cfg.tftp_port.value);
        return 1;
    }

    // Set up each service.
    ip::DhcpPool pool(cfg.dhcp_start, cfg.dhcp_end);
    ip::DhcpServer dhcp(&dhcp_sock, &pool, cfg.server_ip);
    dhcp.set_subnet(cfg.netmask);
    dhcp.set_boot_file(cfg.boot_file.c_str());
    dhcp.set_tftp_server(cfg.tftp_name().c_str());

    udp::TftpServerPosix tftp(&tftp_sock, cfg.tftp_root.c_str());
    tftp.set_timeout(cfg.tftp_timeout_msec);
    tftp.set_attempts(cfg.tftp_attempts);

    // Each service runs its own receive loop.
    std::thread(&ip::DhcpServer::serve, &dhcp).detach();
    std::thread(&udp::TftpServerCore::serve, &tftp).detach();

    std::cout << "All services started. Waiting for PXE clients..." << std::endl
        << "Press Ctrl+C to stop." << std::endl;

    // Wait for Ctrl+C or a termination request.
    int sig = 0;
    while (sigwait(&sigs, &sig) != 0) {}

    // Exit without waiting for in-flight transfers.
    Log(log::INFO, "Shutting down").write10(u32(sig));
    std::cout.flush();
    _exit(0);
}
