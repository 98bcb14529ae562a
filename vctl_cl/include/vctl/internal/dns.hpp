/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "vctl/context.hpp"
#include "vctl/internal/dialer.hpp"

namespace vctl::internal {

constexpr std::uint16_t kDnsTypeA    = 1;
constexpr std::uint16_t kDnsTypeAAAA = 28;

// RFC 1035 query with RD=1 and a single question of class IN.
bool build_dns_query(const std::string& host, std::uint16_t qtype, std::uint16_t id, std::string& out);

struct DnsAnswer {
    int rcode = 0;
    bool truncated = false;
    std::vector<std::string> ips;   // textual A/AAAA records of qtype
};

// Checks the transaction id and QR bit, follows name compression.
bool parse_dns_response(const std::string& msg, std::uint16_t id, std::uint16_t qtype, DnsAnswer& out);

// Minimal stub resolver over the Dialer's UDP path (so DNS traffic gets the
// firewall mark and goes to the configured DNS servers).
class DnsLookup {
public:
    explicit DnsLookup(const Dialer& dialer) : _dialer(dialer) {}

    // A and AAAA records, IPv4 first. Fails only when both queries fail.
    std::error_code lookup_ip(const Context& ctx, const std::string& host,
                              std::vector<std::string>& out) const;

private:
    std::error_code query(const Context& ctx, const std::string& host, std::uint16_t qtype,
                          std::vector<std::string>& out) const;

    const Dialer& _dialer;
};

} // namespace vctl::internal
