/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>
#include <system_error>
#include <vector>
#include <sys/socket.h>
#include "vctl/context.hpp"
#include "vctl/internal/http_low.hpp"

namespace vctl::internal {

enum class Network { Tcp, Udp };

// "1.1.1.1, 9.9.9.9:5353" -> {"1.1.1.1:53", "9.9.9.9:5353"}; empty -> {"1.1.1.1:53"}.
std::vector<std::string> parse_dns_servers(const std::string& csv);

// Opens every outbound socket of the client (HTTPS over TCP, DNS over UDP).
// Sockets get SO_MARK when a firewall mark is set. UDP dials always go to a
// configured DNS server picked per dial, whatever address was requested.
class Dialer {
public:
    // Returns an index in [0, n).
    using IndexSource = std::function<std::size_t(std::size_t n)>;

    Dialer(int firewall_mark, std::vector<std::string> dns_servers, IndexSource pick = {});

    // address: "host:port" or "[v6]:port". TCP hostnames go through getaddrinfo.
    // Socket errors are returned unchanged; there is no retry.
    std::error_code dial(const Context& ctx, Network net, const std::string& address, Socket& out) const;

    // The DNS server the next UDP dial would use (one draw).
    const std::string& pick_dns_server() const;

    int firewall_mark() const { return _mark; }
    const std::vector<std::string>& dns_servers() const { return _dns_servers; }

private:
    std::error_code dial_addr(const Context& ctx, int family, int socktype, int protocol,
                              const sockaddr* sa, socklen_t sa_len, Socket& out) const;

    int _mark = 0;
    std::vector<std::string> _dns_servers;
    IndexSource _pick;
};

} // namespace vctl::internal
