//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <climits>
#include <cstring>
#include <hal_posix/udp_socket.h>
#include <pxeboot/log.h>
#include <pxeboot/utils.h>

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#define CLOSE_SOCKET(x) {::close(x); x = -1;}

using pxeboot::ip::Addr;
using pxeboot::udp::Endpoint;
using pxeboot::udp::Port;
using pxeboot::udp::SocketPosix;

// Set verbosity level for debugging (0/1/2).
static constexpr unsigned DEBUG_VERBOSE = 0;

// Make a poll() query for a single socket.
static inline pollfd make_pollfd(int fd) {
    pollfd tmp;
    tmp.fd = fd;
    tmp.events = POLLIN;
    tmp.revents = 0;
    return tmp;
}

// Shortcut for printing a network error message.
static void log_socket_error(const char* label) {
    int err_code = errno;
    const char* err_msg = strerror(err_code);
    Log(pxeboot::log::ERROR, "SocketPosix: ")
        .write(label).write10(s32(err_code)).write(", ").write(err_msg);
}

// Convert address and port to the POSIX format.
static sockaddr_in make_sockaddr(const Addr& addr, const Port& port) {
    sockaddr_in tmp;
    memset(&tmp, 0, sizeof(tmp));
    tmp.sin_family = AF_INET;
    tmp.sin_addr.s_addr = htonl(addr.value);
    tmp.sin_port = htons(port.value);
    return tmp;
}

SocketPosix::SocketPosix()
    : m_sock(-1)
    , m_port(pxeboot::udp::PORT_NONE)
{
    // Nothing else to initialize.
}

SocketPosix::~SocketPosix() {
    close();
}

void SocketPosix::close() {
    if (m_sock >= 0) CLOSE_SOCKET(m_sock);
    m_port = pxeboot::udp::PORT_NONE;
}

bool SocketPosix::bind(const Port& port, const Addr& addr) {
    // Sanity checks before we start...
    close();

    // Open a new datagram socket.
    m_sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (m_sock < 0) {
        log_socket_error("socket");
        return false;
    }

    // Attempt to set the REUSEADDR flag to allow server restarts.
    // This is nonessential, so ignore errors in this operation.
    const int enable = 1;
    setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    // Attempt to bind to the requested port.
    sockaddr_in request = make_sockaddr(addr, port);
    if (::bind(m_sock, (const sockaddr*)&request, sizeof(request))) {
        log_socket_error("bind");
        close(); return false;
    }

    // Note the assigned port, which may be ephemeral.
    sockaddr_in actual;
    socklen_t actual_len = sizeof(actual);
    if (getsockname(m_sock, (sockaddr*)&actual, &actual_len)) {
        log_socket_error("getsockname");
        close(); return false;
    }
    m_port = Port(ntohs(actual.sin_port));

    if (DEBUG_VERBOSE > 0)
        Log(pxeboot::log::DEBUG, "SocketPosix: Bound").write10(m_port.value);
    return true;
}

bool SocketPosix::set_broadcast(bool enable) {
    if (m_sock < 0) return false;
    const int flag = enable ? 1 : 0;
    if (setsockopt(m_sock, SOL_SOCKET, SO_BROADCAST, &flag, sizeof(flag))) {
        log_socket_error("broadcast");
        return false;
    }
    return true;
}

bool SocketPosix::bind_device(const char* iface) {
    if (m_sock < 0 || !iface) return false;
#ifdef SO_BINDTODEVICE
    socklen_t len = (socklen_t)strlen(iface);
    if (setsockopt(m_sock, SOL_SOCKET, SO_BINDTODEVICE, iface, len)) {
        log_socket_error("bind_device");
        return false;
    }
    return true;
#else
    return false;
#endif
}

bool SocketPosix::send(const Endpoint& dst, const void* data, unsigned len) {
    if (m_sock < 0) return false;
    sockaddr_in addr = make_sockaddr(dst.addr, dst.port);
    ssize_t sent = sendto(m_sock, data, len, 0, (const sockaddr*)&addr, sizeof(addr));
    if (sent < 0) {
        log_socket_error("send");
        return false;
    }
    return (unsigned(sent) == len);
}

int SocketPosix::recv(Endpoint& src, void* data, unsigned len, unsigned timeout_msec) {
    if (m_sock < 0) return pxeboot::udp::RECV_ERROR;

    // Wait for the socket to become readable.
    pollfd query = make_pollfd(m_sock);
    int limit = (timeout_msec == pxeboot::udp::WAIT_FOREVER)
        ? -1 : int(pxeboot::util::min_unsigned(timeout_msec, INT_MAX));
    int count = poll(&query, 1, limit);
    if (count < 0 && errno == EINTR) return pxeboot::udp::RECV_TIMEOUT;
    if (count < 0) {
        log_socket_error("poll");
        return pxeboot::udp::RECV_ERROR;
    }
    if (count == 0) return pxeboot::udp::RECV_TIMEOUT;
    if (query.revents & POLLNVAL) return pxeboot::udp::RECV_ERROR;

    // Read the datagram and note its source.
    sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    ssize_t rcvd = recvfrom(m_sock, data, len, 0, (sockaddr*)&addr, &addr_len);
    if (rcvd < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            return pxeboot::udp::RECV_TIMEOUT;
        log_socket_error("recv");
        return pxeboot::udp::RECV_ERROR;
    }
    src.addr = Addr(ntohl(addr.sin_addr.s_addr));
    src.port = Port(ntohs(addr.sin_port));
    return int(rcvd);
}

Port SocketPosix::local_port() const {
    return m_port;
}

bool pxeboot::udp::iface_exists(const char* iface) {
    return iface && *iface && if_nametoindex(iface) != 0;
}
