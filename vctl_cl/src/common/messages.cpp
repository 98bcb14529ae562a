/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/messages.hpp"
#include "vctl/error.hpp"
#include "vctl/internal/utils.hpp"

#include <cctype>
#include <memory>

namespace {

Json::Value bytes_value(const std::optional<vctl::Bytes>& b) {
    if (!b) return Json::Value(Json::nullValue);
    return Json::Value(vctl::internal::base64_encode(*b));
}

std::error_code read_bytes(const Json::Value& root, const char* name, vctl::Bytes& out) {
    const Json::Value& v = root[name];
    if (v.isNull()) return {};
    if (!v.isString()) return vctl::errc::bad_json;
    if (!vctl::internal::base64_decode(v.asString(), out)) return vctl::errc::bad_encoding;
    return {};
}

std::error_code read_ips(const Json::Value& root, const char* name, std::vector<std::string>& out) {
    const Json::Value& v = root[name];
    out.clear();
    if (v.isNull()) return {};
    if (!v.isArray()) return vctl::errc::bad_json;
    for (const auto& e : v) {
        if (!e.isString()) return vctl::errc::bad_json;
        out.push_back(e.asString());
    }
    return {};
}

} // namespace

namespace vctl {

std::error_code check_host(const std::string& host) {
    if (host.empty() || host.size() > 253) return errc::invalid_host;
    for (char c : host) {
        const bool ok = std::isalnum((unsigned char)c) || c == '-' || c == '.' || c == ':';
        if (!ok) return errc::invalid_host;
    }
    return {};
}

std::error_code check_domain(const std::string& domain) {
    if (domain.empty()) return errc::invalid_domain;
    return {};
}

std::error_code ConnectRequest::check() const {
    if (auto ec = check_host(host)) return ec;
    if (auto ec = check_domain(domain)) return ec;
    if (access_token && access_token->empty()) return errc::invalid_access_token;
    if (public_key.size() != kPublicKeyLen) return errc::invalid_public_key;
    return {};
}

Json::Value ConnectRequest::to_json() const {
    Json::Value root(Json::objectValue);
    root["host"] = host;
    root["domain"] = domain;
    root["accessToken"] = bytes_value(access_token);
    root["publicKey"] = internal::base64_encode(public_key);
    return root;
}

std::error_code ConnectResponse::from_json(const Json::Value& root) {
    if (!root.isObject()) return errc::bad_json;

    if (auto ec = read_bytes(root, "publicKey", public_key)) return ec;
    if (auto ec = read_bytes(root, "presharedKey", preshared_key)) return ec;
    if (auto ec = read_bytes(root, "sessionToken", session_token)) return ec;

    const Json::Value& ep = root["endpoint"];
    if (!ep.isNull()) {
        if (!ep.isObject()) return errc::bad_json;
        if (!ep["IP"].isNull()) {
            if (!ep["IP"].isString()) return errc::bad_json;
            endpoint.ip = ep["IP"].asString();
        }
        if (!ep["Port"].isNull()) {
            if (!ep["Port"].isInt()) return errc::bad_json;
            endpoint.port = ep["Port"].asInt();
        }
        if (!ep["Zone"].isNull()) {
            if (!ep["Zone"].isString()) return errc::bad_json;
            endpoint.zone = ep["Zone"].asString();
        }
    }

    const Json::Value& ka = root["persistentKeepaliveInterval"];
    if (!ka.isNull()) {
        if (!ka.isInt64()) return errc::bad_json;
        persistent_keepalive_ns = ka.asInt64();
    }

    if (auto ec = read_ips(root, "allowedIps", allowed_ips)) return ec;
    if (auto ec = read_ips(root, "DNS", dns)) return ec;
    if (auto ec = read_ips(root, "gateway", gateway)) return ec;

    const Json::Value& stale = root["StaleAccessToken"];
    if (!stale.isNull()) {
        if (!stale.isBool()) return errc::bad_json;
        stale_access_token = stale.asBool();
    }
    return {};
}

std::error_code DisconnectRequest::check() const {
    if (auto ec = check_host(host)) return ec;
    if (auto ec = check_domain(domain)) return ec;
    if (session_token.empty()) return errc::invalid_session_token;
    return {};
}

Json::Value DisconnectRequest::to_json() const {
    Json::Value root(Json::objectValue);
    root["host"] = host;
    root["domain"] = domain;
    root["sessionToken"] = internal::base64_encode(session_token);
    return root;
}

std::error_code AccessTokenRequest::check() const {
    if (auto ec = check_host(host)) return ec;
    if (auto ec = check_domain(domain)) return ec;
    if (access_token) {
        if (access_token->empty()) return errc::invalid_access_token;
        return {};
    }
    if (username.empty() || password.empty()) return errc::missing_credentials;
    return {};
}

Json::Value AccessTokenRequest::to_json() const {
    Json::Value root(Json::objectValue);
    root["host"] = host;
    root["domain"] = domain;
    root["accessToken"] = bytes_value(access_token);
    root["username"] = username;
    root["password"] = password;
    return root;
}

std::string to_indented_json(const Json::Value& v) {
    Json::StreamWriterBuilder wb;
    wb["indentation"] = "\t";
    return Json::writeString(wb, v);
}

std::error_code parse_json(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder rb;
    rb["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(rb.newCharReader());
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &out, &errs)) {
        return errc::bad_json;
    }
    return {};
}

} // namespace vctl
