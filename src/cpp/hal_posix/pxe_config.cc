//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <hal_posix/pxe_config.h>
#include <pxeboot/dhcp_packet.h>
#include <pxeboot/log.h>
#include <pxeboot/udp_tftp.h>

using pxeboot::Config;
using pxeboot::ip::Addr;
using pxeboot::ip::Mask;
using pxeboot::log::ERROR;
using pxeboot::log::LogBuffer;

// Limits on string parameters, set by the BOOTP header fields.
// Each field must leave room for a null terminator.
static constexpr unsigned MAX_BOOT_FILE     = pxeboot::ip::DHCP_FILE_LEN - 1;
static constexpr unsigned MAX_TFTP_NAME     = pxeboot::ip::DHCP_SNAME_LEN - 1;

// Format an IP address in dotted-decimal notation.
static std::string addr_str(const Addr& addr)
{
    LogBuffer buff;
    addr.log_to(buff);
    return std::string(buff.c_str());
}

// Parse a decimal integer in the range [min, max].
static bool parse_uint(const char* str, unsigned min, unsigned max, unsigned& out)
{
    if (!str || *str < '0' || *str > '9') return false;
    errno = 0;
    char* end = 0;
    unsigned long tmp = strtoul(str, &end, 10);
    if (errno || *end || tmp < min || tmp > max) return false;
    out = unsigned(tmp);
    return true;
}

Config::Config()
    : iface("en7")
    , server_ip(10, 0, 0, 1)
    , dhcp_start(10, 0, 0, 100)
    , dhcp_end(10, 0, 0, 200)
    , netmask(255, 255, 255, 0)
    , boot_file("bootx64.efi")
    , tftp_server()
    , tftp_root("./tftp")
    , http_root("./http")
    , http_port(8080)
    , dhcp_port(pxeboot::udp::PORT_DHCP_SERVER)
    , tftp_port(pxeboot::udp::PORT_TFTP_SERVER)
    , tftp_timeout_msec(pxeboot::udp::TFTP_TIMEOUT_MSEC)
    , tftp_attempts(pxeboot::udp::TFTP_MAX_ATTEMPTS)
{
    // Nothing else to initialize.
}

std::string Config::tftp_name() const
{
    return tftp_server.empty() ? addr_str(server_ip) : tftp_server;
}

bool Config::validate() const
{
    unsigned errors = 0;
    const pxeboot::ip::Subnet net = subnet();
    const Addr network(server_ip.value & netmask.value);
    const Addr bcast = net.broadcast();

    if (iface.empty()) {
        Log(ERROR, "Config", "Interface name required");
        ++errors;
    }
    if (!server_ip.is_unicast()) {
        Log(ERROR, "Config", "Server address must be unicast").write(server_ip);
        ++errors;
    }
    if (!netmask.is_contiguous() || netmask.prefix() == 0 || netmask.prefix() > 30) {
        Log(ERROR, "Config", "Invalid subnet mask").write(netmask);
        ++errors;
    }
    if (dhcp_end < dhcp_start) {
        Log(ERROR, "Config", "DHCP range end precedes start").write(dhcp_end);
        ++errors;
    }
    if (!net.contains(dhcp_start) || !net.contains(dhcp_end)) {
        Log(ERROR, "Config", "DHCP range outside subnet ").write_obj(net);
        ++errors;
    }
    if (!(server_ip < dhcp_start) && !(dhcp_end < server_ip)) {
        Log(ERROR, "Config", "Server address inside DHCP range").write(server_ip);
        ++errors;
    }
    if (server_ip == network || server_ip == bcast) {
        Log(ERROR, "Config", "Server address reserved by subnet").write(server_ip);
        ++errors;
    }
    if (!(network < dhcp_start) || !(dhcp_end < bcast)) {
        Log(ERROR, "Config", "DHCP range includes network or broadcast address");
        ++errors;
    }
    if (boot_file.empty() || boot_file.size() > MAX_BOOT_FILE) {
        Log(ERROR, "Config", "Boot filename length")
            .write10(u32(boot_file.size()));
        ++errors;
    }
    if (tftp_name().size() > MAX_TFTP_NAME) {
        Log(ERROR, "Config", "TFTP server name length")
            .write10(u32(tftp_name().size()));
        ++errors;
    }
    if (tftp_root.empty()) {
        Log(ERROR, "Config", "TFTP root folder required");
        ++errors;
    }
    if (http_root.empty()) {
        Log(ERROR, "Config", "HTTP root folder required");
        ++errors;
    }
    if (http_port == 0 || http_port > 65535) {
        Log(ERROR, "Config", "Invalid HTTP port").write10(u32(http_port));
        ++errors;
    }
    if (tftp_attempts == 0) {
        Log(ERROR, "Config", "TFTP attempt limit must be nonzero");
        ++errors;
    }
    return errors == 0;
}

void Config::print(std::ostream& out) const
{
    out << "=== PxeBoot Server ===" << std::endl
        << "Interface:  " << iface << std::endl
        << "Server IP:  " << addr_str(server_ip) << std::endl
        << "Netmask:    " << addr_str(netmask) << std::endl
        << "DHCP Range: " << addr_str(dhcp_start)
        << " - " << addr_str(dhcp_end) << std::endl
        << "TFTP Root:  " << tftp_root << std::endl
        << "TFTP Name:  " << tftp_name() << std::endl
        << "HTTP Root:  " << http_root << " (port " << http_port << ")" << std::endl
        << "Boot File:  " << boot_file << std::endl;
}

// Each flag updates one field from its string value.
typedef bool (*FlagSetter)(Config& cfg, const char* value);

static bool set_iface(Config& cfg, const char* value)
    {cfg.iface = value; return true;}
static bool set_ip(Config& cfg, const char* value)
    {return pxeboot::ip::parse_addr(value, cfg.server_ip);}
static bool set_dhcp_start(Config& cfg, const char* value)
    {return pxeboot::ip::parse_addr(value, cfg.dhcp_start);}
static bool set_dhcp_end(Config& cfg, const char* value)
    {return pxeboot::ip::parse_addr(value, cfg.dhcp_end);}
static bool set_netmask(Config& cfg, const char* value) {
    Addr tmp;
    if (!pxeboot::ip::parse_addr(value, tmp)) return false;
    cfg.netmask = Mask(tmp);
    return true;
}
static bool set_boot_file(Config& cfg, const char* value)
    {cfg.boot_file = value; return true;}
static bool set_tftp_server(Config& cfg, const char* value)
    {cfg.tftp_server = value; return true;}
static bool set_tftp_root(Config& cfg, const char* value)
    {cfg.tftp_root = value; return true;}
static bool set_http_root(Config& cfg, const char* value)
    {cfg.http_root = value; return true;}
static bool set_http_port(Config& cfg, const char* value)
    {return parse_uint(value, 1, 65535, cfg.http_port);}
static bool set_tftp_timeout(Config& cfg, const char* value)
    {return parse_uint(value, 1, 600000, cfg.tftp_timeout_msec);}
static bool set_tftp_attempts(Config& cfg, const char* value)
    {return parse_uint(value, 1, 100, cfg.tftp_attempts);}

// Table of recognized flags.
struct FlagInfo {
    const char* name;
    FlagSetter setter;
    const char* arg;
    const char* help;
};

static const FlagInfo FLAGS[] = {
    {"iface",       set_iface,          "name", "Network interface to listen on"},
    {"ip",          set_ip,             "addr", "Server IP address on the PXE interface"},
    {"dhcp-start",  set_dhcp_start,     "addr", "DHCP range start"},
    {"dhcp-end",    set_dhcp_end,       "addr", "DHCP range end"},
    {"netmask",     set_netmask,        "mask", "Subnet mask"},
    {"tftp-root",   set_tftp_root,      "dir",  "TFTP root directory"},
    {"tftp-server", set_tftp_server,    "name", "TFTP server name (default: server IP)"},
    {"tftp-timeout", set_tftp_timeout,  "msec", "TFTP retransmit timeout"},
    {"tftp-attempts", set_tftp_attempts, "n",   "TFTP attempts per block"},
    {"http-root",   set_http_root,      "dir",  "HTTP root directory"},
    {"http-port",   set_http_port,      "port", "HTTP server port"},
    {"boot-file",   set_boot_file,      "file", "PXE boot filename (UEFI)"},
};

static const FlagInfo* find_flag(const std::string& name)
{
    for (const FlagInfo& flag : FLAGS) {
        if (name == flag.name) return &flag;
    }
    return 0;
}

int pxeboot::parse_args(int argc, const char* const argv[], Config& cfg)
{
    for (int a = 1 ; a < argc ; ++a) {
        // Strip one or two leading dashes.
        const char* arg = argv[a];
        if (arg[0] != '-' || arg[1] == 0) {
            Log(ERROR, "Config", "Unexpected argument").write(" ").write(arg);
            return PARSE_ERROR;
        }
        arg += (arg[1] == '-') ? 2 : 1;

        // Split "name=value" if applicable.
        std::string name(arg);
        const char* value = 0;
        const char* eq = strchr(arg, '=');
        if (eq) {
            name.assign(arg, eq - arg);
            value = eq + 1;
        }

        if (name == "help" || name == "h") {
            print_usage(std::cout, argv[0]);
            return PARSE_HELP;
        }

        const FlagInfo* flag = find_flag(name);
        if (!flag) {
            Log(ERROR, "Config", "Unknown flag").write(" ").write(argv[a]);
            return PARSE_ERROR;
        }
        if (!value) {
            if (a + 1 >= argc) {
                Log(ERROR, "Config", "Missing value for").write(" ").write(argv[a]);
                return PARSE_ERROR;
            }
            value = argv[++a];
        }
        if (!flag->setter(cfg, value)) {
            Log(ERROR, "Config", "Invalid value for ")
                .write(flag->name).write(": ").write(value);
            return PARSE_ERROR;
        }
    }
    return PARSE_OK;
}

void pxeboot::print_usage(std::ostream& out, const char* progname)
{
    out << "pxe_server provides DHCP and TFTP services for network boot." << std::endl
        << "Usage: " << (progname ? progname : "pxe_server") << " [options]" << std::endl;
    for (const FlagInfo& flag : FLAGS) {
        std::string lhs = std::string("  --") + flag.name + " <" + flag.arg + ">";
        if (lhs.size() < 28) lhs.resize(28, ' ');
        out << lhs << flag.help << std::endl;
    }
    out << "  --help                    Print this message" << std::endl;
}
