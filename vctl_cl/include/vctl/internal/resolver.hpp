/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "vctl/context.hpp"
#include "vctl/types.hpp"

namespace vctl::internal {

// Every service certificate carries this name as a SAN; used when the
// configured host is a literal IP.
inline constexpr const char* kFallbackServerName = "hideservers.net";
inline constexpr std::chrono::seconds kLookupTimeout{5};

using LookupFn = std::function<std::error_code(const Context& ctx, const std::string& host,
                                               std::vector<std::string>& ips)>;

// Resolves the configured host once per session and sticks to the result.
// The service balances DNS rapidly, so all requests of a session must hit
// the same IP. A later failed lookup keeps the previous address.
class EndpointResolver {
public:
    EndpointResolver(std::string host, std::uint16_t port, LookupFn lookup);

    std::error_code resolve(const Context& ctx);

    const std::optional<Endpoint>& remote() const { return _remote; }
    const std::string& server_name() const { return _server_name; }

    // True when the last resolve() succeeded only by reusing the previous address.
    bool stale() const { return _stale; }

private:
    std::string _host;
    std::uint16_t _port;
    LookupFn _lookup;

    std::optional<Endpoint> _remote;
    std::string _server_name;
    bool _stale = false;
};

} // namespace vctl::internal
