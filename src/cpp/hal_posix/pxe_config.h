//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of PxeBoot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Process configuration for the PXE boot server
//!
//!\details
//! The `Config` structure holds every user-adjustable parameter for the
//! DHCP and TFTP services, plus the root folder and port of the external
//! HTTP file service.  Defaults match the reference deployment: a small
//! /24 network with the server at 10.0.0.1.
//!
//! Typical usage:
//!\code
//!     pxeboot::Config cfg;
//!     int rc = pxeboot::parse_args(argc, argv, cfg);
//!     if (rc != pxeboot::PARSE_OK) return ...;
//!     if (!cfg.validate()) return 2;
//!\endcode

#pragma once

#include <iosfwd>
#include <string>
#include <pxeboot/ip_core.h>
#include <pxeboot/udp_core.h>

namespace pxeboot {
    //! User-adjustable parameters for all services.
    struct Config {
        std::string iface;              //!< Network interface name
        pxeboot::ip::Addr server_ip;    //!< Our address on that interface
        pxeboot::ip::Addr dhcp_start;   //!< First address in lease range
        pxeboot::ip::Addr dhcp_end;     //!< Last address in lease range
        pxeboot::ip::Mask netmask;      //!< Subnet mask for the interface
        std::string boot_file;          //!< Bootloader filename
        std::string tftp_server;        //!< TFTP server name (empty = server_ip)
        std::string tftp_root;          //!< Folder served by TFTP
        std::string http_root;          //!< Folder served by HTTP
        unsigned http_port;             //!< Port for the HTTP service
        pxeboot::udp::Port dhcp_port;   //!< DHCP listening port
        pxeboot::udp::Port tftp_port;   //!< TFTP listening port
        unsigned tftp_timeout_msec;     //!< TFTP per-attempt timeout
        unsigned tftp_attempts;         //!< TFTP attempts per block

        //! Construct with default parameters.
        Config();

        //! Subnet defined by the server address and mask.
        inline pxeboot::ip::Subnet subnet() const
            {return pxeboot::ip::Subnet{server_ip, netmask};}

        //! TFTP server name, defaulting to the server address.
        std::string tftp_name() const;

        //! Check parameters for consistency.
        //! Logs one error for each problem; returns true if valid.
        bool validate() const;

        //! Print a human-readable summary of the configuration.
        void print(std::ostream& out) const;
    };

    //! Return codes for parse_args().
    constexpr int PARSE_OK      = 0;    //!< Continue with startup
    constexpr int PARSE_HELP    = 1;    //!< Usage printed, exit normally
    constexpr int PARSE_ERROR   = 2;    //!< Invalid arguments, exit(2)

    //! Update configuration from command-line arguments.
    //! Accepts "--name value", "--name=value", or a single leading dash.
    int parse_args(int argc, const char* const argv[], pxeboot::Config& cfg);

    //! Print the command-line usage prompt.
    void print_usage(std::ostream& out, const char* progname);
}
