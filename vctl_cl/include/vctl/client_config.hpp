/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstdint>
#include "vctl/filter.hpp"
#include "vctl/pins.hpp"

namespace vctl {

// Public client configuration. Copied by the client at construction and
// not changed afterwards (except port 0 becoming kDefaultPort).
struct ClientConfig {
    // Endpoint
    std::string   host;                      // FQDN or literal IP of the VPN server
    std::uint16_t port = 0;                  // 0 -> kDefaultPort (432)
    std::string   domain = "hide.me";
    std::string   api_version = "v1.0.0";    // first path segment of REST URLs

    // Credentials
    std::string access_token_file;           // base64 text, rewritten on refresh
    std::string username;                    // fallback when no access token is held
    std::string password;

    // Timeouts
    int rest_timeout_sec              = 10;
    int reconnect_wait_sec            = 30;  // caller-side reconnect pacing
    int access_token_update_delay_sec = 2;   // caller-side stale token refresh delay
    int tls_handshake_timeout_sec     = 5;
    int response_header_timeout_sec   = 5;

    // TLS
    std::string ca_file;                     // PEM bundle; empty -> system roots
    PinTable    pins = default_pin_table();
    std::string user_agent = "vctl-client/1";

    // Sockets
    int         firewall_mark = 0;           // SO_MARK; 0 disables
    std::string dns_servers;                 // "ip[:port],..."; empty -> 1.1.1.1:53

    // Filtering
    Filter        filter;
    std::string   filter_host = "vpn.hide.me";
    std::uint16_t filter_port = 4321;

    // Logging
    std::string log_file;                    // empty -> stdout only
};

} // namespace vctl
