/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/client.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"
#include "vctl/pins.hpp"

#include "vctl/internal/dialer.hpp"
#include "vctl/internal/dns.hpp"
#include "vctl/internal/https_transport.hpp"
#include "vctl/internal/resolver.hpp"
#include "vctl/internal/token_store.hpp"
#include "vctl/internal/utils.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace {

constexpr const char* kServiceSuffix = ".hideservers.net";

// Requests name the server without the shared service suffix.
std::string service_host(const std::string& host) {
    if (vctl::internal::ends_with(host, kServiceSuffix)) {
        return host.substr(0, host.size() - std::char_traits<char>::length(kServiceSuffix));
    }
    return host;
}

} // namespace

namespace vctl {

struct Client::Impl {
    ClientConfig cfg;
    std::string host;                        // service host sent in requests

    internal::Dialer dialer;
    PinVerifier pins;
    internal::DnsLookup dns;
    internal::EndpointResolver resolver;
    internal::TokenStore tokens;
    std::unique_ptr<Transport> transport;

    Impl(const ClientConfig& c, HostLookup lookup)
        : cfg(c),
          host(service_host(c.host)),
          dialer(c.firewall_mark, internal::parse_dns_servers(c.dns_servers)),
          pins(c.pins),
          dns(dialer),
          resolver(c.host, c.port,
                   lookup ? internal::LookupFn(std::move(lookup))
                          : internal::LookupFn([this](const Context& ctx, const std::string& h,
                                                      std::vector<std::string>& ips) {
                                return dns.lookup_ip(ctx, h, ips);
                            })),
          tokens(c.access_token_file) {}

    PostTarget rest_target(const char* op) const {
        PostTarget t;
        t.host = resolver.remote()->ip;
        t.port = resolver.remote()->port;
        t.server_name = resolver.server_name();
        t.path = "/" + cfg.api_version + "/" + op;
        return t;
    }

    // One JSON POST bounded by the REST timeout. Only a 200 yields a body.
    std::error_code post_json(const Context& ctx, const PostTarget& target,
                              const Json::Value& payload, std::string& body)
    {
        const std::string json = to_indented_json(payload);
        const Context rest_ctx = ctx.with_timeout(std::chrono::seconds(std::max(1, cfg.rest_timeout_sec)));

        HttpResponse resp;
        if (auto ec = transport->post(rest_ctx, target, json, resp)) {
            log_line("[REST] [ERR] POST " + target.path + " to " +
                     internal::join_host_port(target.host, target.port) + " failed, " + ec.message());
            return ec;
        }
        if (resp.status_code == 403) {
            log_line("[REST] [ERR] Application update required");
            return errc::update_required;
        }
        if (resp.status_code != 200) {
            log_line("[REST] [ERR] Bad HTTP response (" + std::to_string(resp.status_code) + ")");
            return errc::bad_http_status;
        }
        body.swap(resp.body);
        return {};
    }
};

Client::Client(std::unique_ptr<Impl> p) : _p(std::move(p)) {}
Client::~Client() = default;

std::error_code Client::create(const ClientConfig& cfg, std::unique_ptr<Client>& out) {
    return create(cfg, Hooks{}, out);
}

std::error_code Client::create(const ClientConfig& cfg, Hooks hooks, std::unique_ptr<Client>& out) {
    out.reset();

    ClientConfig c = cfg;
    if (c.port == 0) c.port = kDefaultPort;
    if (!c.log_file.empty()) set_log_file(c.log_file);

    if (auto ec = check_host(c.host)) return ec;
    if (auto ec = check_domain(c.domain)) return ec;

    auto impl = std::make_unique<Impl>(c, std::move(hooks.lookup));
    if (hooks.transport) {
        impl->transport = std::move(hooks.transport);
    } else {
        auto https = std::make_unique<internal::HttpsTransport>(impl->cfg, impl->dialer, impl->pins);
        if (auto ec = https->status()) return ec;
        impl->transport = std::move(https);
    }

    out.reset(new Client(std::move(impl)));
    return {};
}

std::error_code Client::resolve(const Context& ctx) {
    return _p->resolver.resolve(ctx);
}

const std::optional<Endpoint>& Client::remote() const { return _p->resolver.remote(); }
const std::string& Client::server_name() const { return _p->resolver.server_name(); }
bool Client::stale() const { return _p->resolver.stale(); }

bool Client::have_access_token() const { return _p->tokens.have(); }

const ClientConfig& Client::config() const { return _p->cfg; }

std::error_code Client::connect(const Context& ctx, const Bytes& public_key, ConnectResponse& out) {
    ConnectRequest req;
    req.host = _p->host;
    req.domain = _p->cfg.domain;
    req.access_token = _p->tokens.token();
    req.public_key = public_key;
    if (auto ec = req.check()) return ec;
    if (!_p->resolver.remote()) return errc::not_resolved;

    std::string body;
    if (auto ec = _p->post_json(ctx, _p->rest_target("connect"), req.to_json(), body)) return ec;

    Json::Value root;
    if (auto ec = parse_json(body, root)) return ec;

    ConnectResponse resp;
    if (auto ec = resp.from_json(root)) return ec;
    out = std::move(resp);
    return {};
}

std::error_code Client::disconnect(const Context& ctx, const Bytes& session_token) {
    DisconnectRequest req;
    req.host = _p->host;
    req.domain = _p->cfg.domain;
    req.session_token = session_token;
    if (auto ec = req.check()) return ec;
    if (!_p->resolver.remote()) return errc::not_resolved;

    std::string body;
    return _p->post_json(ctx, _p->rest_target("disconnect"), req.to_json(), body);
}

std::error_code Client::get_access_token(const Context& ctx) {
    AccessTokenRequest req;
    req.host = _p->host;
    req.domain = _p->cfg.domain;
    req.access_token = _p->tokens.token();
    req.username = _p->cfg.username;
    req.password = _p->cfg.password;
    if (auto ec = req.check()) return ec;
    if (!_p->resolver.remote()) return errc::not_resolved;

    std::string body;
    if (auto ec = _p->post_json(ctx, _p->rest_target("accessToken"), req.to_json(), body)) return ec;

    Json::Value root;
    if (auto ec = parse_json(body, root)) return ec;
    if (!root.isString()) {
        log_line("[TOKEN] [ERR] Access token response is not a JSON string");
        return errc::bad_json;
    }
    return _p->tokens.update(root.asString());
}

std::error_code Client::apply_filter(const Context& ctx) {
    if (auto ec = _p->cfg.filter.check()) return ec;

    PostTarget t;
    t.host = _p->cfg.filter_host;
    t.port = _p->cfg.filter_port;
    t.server_name = _p->resolver.server_name().empty() ? _p->cfg.filter_host
                                                       : _p->resolver.server_name();
    t.path = "/filter";

    std::string body;
    if (auto ec = _p->post_json(ctx, t, _p->cfg.filter.to_json(), body)) return ec;
    if (body == "false") {
        log_line("[REST] [ERR] Filter was not applied");
        return errc::filter_failed;
    }
    return {};
}

} // namespace vctl
