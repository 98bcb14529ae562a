/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/resolver.hpp"
#include "vctl/internal/utils.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"

namespace vctl::internal {

EndpointResolver::EndpointResolver(std::string host, std::uint16_t port, LookupFn lookup)
    : _host(std::move(host)), _port(port), _lookup(std::move(lookup)) {}

std::error_code EndpointResolver::resolve(const Context& ctx) {
    _stale = false;

    if (is_ip_literal(_host)) {
        _remote = Endpoint{_host, _port};
        _server_name = kFallbackServerName;
        return {};
    }

    std::vector<std::string> ips;
    std::error_code ec = errc::dns_lookup_failed;
    if (_lookup) {
        const Context lookup_ctx = ctx.with_timeout(kLookupTimeout);
        ec = _lookup(lookup_ctx, _host, ips);
    }
    if (ec) {
        log_line("[RESOLVE] [ERR] " + _host + " lookup failed, " + ec.message());
        if (_remote) {
            // Reconnects keep going to the address this session started with.
            log_line("[RESOLVE] Using previous lookup response " + _remote->to_string());
            _stale = true;
            return {};
        }
        return ec;
    }

    if (ips.empty()) {
        log_line("[RESOLVE] dns lookup failed for " + _host);
        return errc::dns_no_address;
    }
    if (ips.front().empty()) {
        log_line("[RESOLVE] no IP found for " + _host);
        return errc::dns_no_ip;
    }

    _server_name = _host;
    _remote = Endpoint{ips.front(), _port};
    log_line("[RESOLVE] Resolved " + _host + " to " + _remote->ip);
    return {};
}

} // namespace vctl::internal
