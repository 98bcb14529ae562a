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
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "vctl/client_config.hpp"
#include "vctl/context.hpp"
#include "vctl/messages.hpp"
#include "vctl/transport.hpp"
#include "vctl/types.hpp"

namespace vctl {

// Host name -> textual IPs, IPv4 first.
using HostLookup = std::function<std::error_code(const Context& ctx, const std::string& host,
                                                 std::vector<std::string>& ips)>;

// Control-channel client of the VPN service: resolves the server once per
// session, then runs Connect / Disconnect / AccessToken / Filter exchanges
// as JSON POSTs over pinned TLS. Not internally synchronized.
class Client {
public:
    // Replacements for the network-facing parts; empty members keep the defaults.
    struct Hooks {
        std::unique_ptr<Transport> transport;
        HostLookup lookup;
    };

    // Fails on an invalid host or domain, or when the TLS context cannot be
    // built (errc::ca_bundle_failed for an unreadable CA bundle).
    static std::error_code create(const ClientConfig& cfg, std::unique_ptr<Client>& out);
    static std::error_code create(const ClientConfig& cfg, Hooks hooks, std::unique_ptr<Client>& out);

    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Pins the session to one server IP. Must succeed before connect(),
    // disconnect() or get_access_token(). A failed lookup after an earlier
    // success keeps the previous address and returns success with stale() set.
    std::error_code resolve(const Context& ctx);

    const std::optional<Endpoint>& remote() const;
    const std::string& server_name() const;
    bool stale() const;

    bool have_access_token() const;

    // POST /<api>/connect with the held access token and a WireGuard public key.
    std::error_code connect(const Context& ctx, const Bytes& public_key, ConnectResponse& out);

    // POST /<api>/disconnect; the response body is ignored.
    std::error_code disconnect(const Context& ctx, const Bytes& session_token);

    // POST /<api>/accessToken; the issued token replaces the held one and is
    // written to the token file.
    std::error_code get_access_token(const Context& ctx);

    // POST the configured filter to the filtering endpoint.
    std::error_code apply_filter(const Context& ctx);

    const ClientConfig& config() const;

private:
    struct Impl;
    explicit Client(std::unique_ptr<Impl> p);
    std::unique_ptr<Impl> _p;
};

} // namespace vctl
