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
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <json/json.h>
#include "vctl/types.hpp"

namespace vctl {

// Wire records of the REST protocol. Byte fields travel as standard
// base64 strings; an absent byte field is JSON null.
// Each request validates itself with check() before anything is sent.

struct ConnectRequest {
    std::string host;                      // service host, suffix stripped
    std::string domain;
    std::optional<Bytes> access_token;
    Bytes public_key;                      // kPublicKeyLen bytes

    std::error_code check() const;
    Json::Value to_json() const;
};

struct UdpEndpoint {
    std::string ip;
    int port = 0;
    std::string zone;
};

struct ConnectResponse {
    Bytes public_key;
    Bytes preshared_key;
    UdpEndpoint endpoint;
    std::int64_t persistent_keepalive_ns = 0;
    std::vector<std::string> allowed_ips;
    std::vector<std::string> dns;
    std::vector<std::string> gateway;
    Bytes session_token;
    bool stale_access_token = false;

    // Missing members keep their defaults; wrongly typed members fail
    // with errc::bad_json, undecodable byte members with errc::bad_encoding.
    std::error_code from_json(const Json::Value& root);
};

struct DisconnectRequest {
    std::string host;
    std::string domain;
    Bytes session_token;

    std::error_code check() const;
    Json::Value to_json() const;
};

struct AccessTokenRequest {
    std::string host;
    std::string domain;
    std::optional<Bytes> access_token;
    std::string username;                  // used when no token is held
    std::string password;

    std::error_code check() const;
    Json::Value to_json() const;
};

// Shared field checks.
std::error_code check_host(const std::string& host);
std::error_code check_domain(const std::string& domain);

// Tab-indented serialization and lenient (non-strict root) parsing.
std::string to_indented_json(const Json::Value& v);
std::error_code parse_json(const std::string& text, Json::Value& out);

} // namespace vctl
