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

namespace vctl {

// Binary blobs (keys, tokens) are carried in std::string.
using Bytes = std::string;

inline constexpr std::uint16_t kDefaultPort = 432;
inline constexpr std::size_t   kPublicKeyLen = 32;   // WireGuard key size

// Resolved session endpoint: literal IP + port.
struct Endpoint {
    std::string   ip;
    std::uint16_t port = 0;

    // "ip:port", IPv6 in brackets.
    std::string to_string() const;
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.ip == b.ip && a.port == b.port;
}
inline bool operator!=(const Endpoint& a, const Endpoint& b) { return !(a == b); }

} // namespace vctl
