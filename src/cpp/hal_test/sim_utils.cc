//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <map>
#include <random>
#include <hal_posix/file_io.h>
#include <hal_test/sim_utils.h>
#include <pxeboot/io_readable.h>
#include <pxeboot/io_writeable.h>
#include <pxeboot/udp_tftp.h>
#include <pxeboot/utils.h>

using pxeboot::io::ArrayRead;
using pxeboot::io::ArrayWrite;
using pxeboot::ip::DhcpPacket;
using pxeboot::test::MockSocket;
using pxeboot::udp::Endpoint;
using pxeboot::util::extract_be_u16;

// Global PRNG for the rand_*() functions.
static std::mt19937 global_prng;

// Port numbers assigned to child sockets start here.
static constexpr u16 CHILD_PORT_BASE = 49152;

bool pxeboot::test::pre_test_reset() {
    // Set a consistent seed for unit-testing purposes.
    global_prng.seed(0xED743CC4u);
    return true;
}

u8 pxeboot::test::rand_u8() {
    return u8(global_prng());
}

u32 pxeboot::test::rand_u32() {
    return u32(global_prng());
}

std::string pxeboot::test::sim_filename(const char* pre, const char* ext) {
    // Persistent counter lookup for each unique prefix.
    static std::map<std::string, unsigned> counts;
    unsigned idx = counts[pre]++;
    // Construct the filename.
    char buff[256];
    snprintf(buff, sizeof(buff), "simulations/%s_%03u.%s", pre, idx, ext);
    return std::string(buff);
}

std::string pxeboot::test::sim_folder(const char* pre) {
    // Persistent counter lookup for each unique prefix.
    static std::map<std::string, unsigned> counts;
    unsigned idx = counts[pre]++;
    char buff[256];
    snprintf(buff, sizeof(buff), "simulations/%s_%03u", pre, idx);
    if (!pxeboot::util::make_folder(buff)) return std::string();
    return std::string(buff);
}

bool pxeboot::test::write_file(const std::string& path, const std::string& data) {
    pxeboot::io::FileWriter file(path.c_str());
    if (!file.is_open()) return false;
    file.write_bytes(unsigned(data.size()), data.data());
    bool ok = file.write_finalize();
    file.close();
    return ok;
}

std::string pxeboot::test::random_string(unsigned nbytes) {
    std::string tmp(nbytes, 0);
    for (unsigned a = 0 ; a < nbytes ; ++a)
        tmp[a] = char(rand_u8());
    return tmp;
}

unsigned pxeboot::test::LogRecorder::count(const char* msg) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    unsigned total = 0;
    for (const std::string& str : m_msgs) {
        if (str.find(msg) != std::string::npos) ++total;
    }
    return total;
}

unsigned pxeboot::test::LogRecorder::total() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return unsigned(m_msgs.size());
}

void pxeboot::test::LogRecorder::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_msgs.clear();
}

void pxeboot::test::LogRecorder::log_event(s8 priority, unsigned nbytes, const char* msg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_msgs.push_back(std::string(msg, msg + nbytes));
}

MockSocket::MockSocket(const pxeboot::udp::Port& port)
    : m_root(this)
    , m_port(port)
    , m_children(0)
    , m_closed(false)
{
    // Nothing else to initialize.
}

MockSocket::MockSocket(MockSocket* parent)
    : m_root(parent->m_root)
    , m_port(u16(CHILD_PORT_BASE + parent->m_root->child_count()))
    , m_children(0)
    , m_closed(false)
{
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    ++m_root->m_children;
}

void MockSocket::push(const Endpoint& src, const void* data, unsigned len) {
    const u8* bytes = (const u8*)data;
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    m_root->m_rxqueue.push_back(Rcvd{src, std::vector<u8>(bytes, bytes + len), false});
}

void MockSocket::push(const Endpoint& src, const std::vector<u8>& data) {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    m_root->m_rxqueue.push_back(Rcvd{src, data, false});
}

void MockSocket::push_error() {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    m_root->m_rxqueue.push_back(Rcvd{Endpoint(), std::vector<u8>(), true});
}

void MockSocket::fail_send(const pxeboot::ip::Addr& dst) {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    m_root->m_fail.push_back(dst);
}

void MockSocket::close() {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    m_root->m_closed = true;
}

unsigned MockSocket::sent_count() const {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    return unsigned(m_root->m_sent.size());
}

MockSocket::Sent MockSocket::sent(unsigned idx) const {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    if (idx < m_root->m_sent.size()) return m_root->m_sent[idx];
    return Sent{Endpoint(), pxeboot::udp::PORT_NONE, std::vector<u8>()};
}

void MockSocket::sent_clear() {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    m_root->m_sent.clear();
}

unsigned MockSocket::child_count() const {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    return m_root->m_children;
}

unsigned MockSocket::queued() const {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    return unsigned(m_root->m_rxqueue.size());
}

bool MockSocket::send(const Endpoint& dst, const void* data, unsigned len) {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    auto& fail = m_root->m_fail;
    if (std::find(fail.begin(), fail.end(), dst.addr) != fail.end()) return false;
    const u8* bytes = (const u8*)data;
    m_root->m_sent.push_back(Sent{dst, m_port, std::vector<u8>(bytes, bytes + len)});
    return true;
}

bool MockSocket::is_open() const {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    return !m_root->m_closed || !m_root->m_rxqueue.empty();
}

int MockSocket::recv(Endpoint& src, void* data, unsigned len, unsigned timeout_msec) {
    std::lock_guard<std::mutex> lock(m_root->m_mutex);
    auto& queue = m_root->m_rxqueue;
    if (queue.empty())
        return m_root->m_closed ? pxeboot::udp::RECV_ERROR : pxeboot::udp::RECV_TIMEOUT;
    Rcvd next = queue.front();
    queue.pop_front();
    if (next.error) return pxeboot::udp::RECV_ERROR;
    unsigned copy = pxeboot::util::min_unsigned(len, unsigned(next.data.size()));
    if (copy) memcpy(data, next.data.data(), copy);
    src = next.src;
    return int(copy);
}

DhcpPacket pxeboot::test::make_dhcp(
    u8 msg_type, const pxeboot::eth::MacAddr& mac, u32 xid)
{
    DhcpPacket pkt;
    pkt.op      = pxeboot::ip::DHCP_OP_REQUEST;
    pkt.htype   = 1;
    pkt.hlen    = 6;
    pkt.xid     = xid;
    pkt.flags   = 0x8000;
    pkt.chaddr  = mac;
    pkt.set_option_u8(pxeboot::ip::DHCP_OPTION_MSG_TYPE, msg_type);
    return pkt;
}

std::vector<u8> pxeboot::test::encode(const DhcpPacket& pkt) {
    std::vector<u8> tmp(pxeboot::ip::DHCP_MAX_BYTES);
    ArrayWrite wr(tmp.data(), unsigned(tmp.size()));
    pkt.write_to(&wr);
    if (!wr.write_finalize()) return std::vector<u8>();
    tmp.resize(wr.written_len());
    return tmp;
}

bool pxeboot::test::decode(const std::vector<u8>& data, DhcpPacket& pkt) {
    ArrayRead rd(data.data(), unsigned(data.size()));
    return pkt.read_from(&rd);
}

// Shared code for read and write requests.
static std::vector<u8> tftp_request(u16 opcode, const char* filename, const char* mode) {
    u8 buff[pxeboot::udp::TFTP_MAX_PACKET];
    ArrayWrite wr(buff, sizeof(buff));
    wr.write_u16(opcode);
    wr.write_str(filename);
    wr.write_u8(0);
    wr.write_str(mode);
    wr.write_u8(0);
    if (!wr.write_finalize()) return std::vector<u8>();
    return std::vector<u8>(buff, buff + wr.written_len());
}

std::vector<u8> pxeboot::test::tftp_rrq(const char* filename, const char* mode) {
    return tftp_request(pxeboot::udp::TFTP_OPCODE_RRQ, filename, mode);
}

std::vector<u8> pxeboot::test::tftp_wrq(const char* filename, const char* mode) {
    return tftp_request(pxeboot::udp::TFTP_OPCODE_WRQ, filename, mode);
}

std::vector<u8> pxeboot::test::tftp_ack(u16 block) {
    std::vector<u8> tmp(4);
    pxeboot::util::write_be_u16(tmp.data() + 0, pxeboot::udp::TFTP_OPCODE_ACK);
    pxeboot::util::write_be_u16(tmp.data() + 2, block);
    return tmp;
}

std::vector<u8> pxeboot::test::tftp_error(u16 code, const char* msg) {
    u8 buff[pxeboot::udp::TFTP_MAX_PACKET];
    ArrayWrite wr(buff, sizeof(buff));
    wr.write_u16(pxeboot::udp::TFTP_OPCODE_ERROR);
    wr.write_u16(code);
    wr.write_str(msg);
    wr.write_u8(0);
    if (!wr.write_finalize()) return std::vector<u8>();
    return std::vector<u8>(buff, buff + wr.written_len());
}

u16 pxeboot::test::tftp_opcode(const std::vector<u8>& pkt) {
    return (pkt.size() >= 2) ? extract_be_u16(pkt.data()) : 0;
}

u16 pxeboot::test::tftp_block(const std::vector<u8>& pkt) {
    return (pkt.size() >= 4) ? extract_be_u16(pkt.data() + 2) : 0;
}

std::string pxeboot::test::tftp_payload(const std::vector<u8>& pkt) {
    if (pkt.size() < 4) return std::string();
    return std::string(pkt.begin() + 4, pkt.end());
}
