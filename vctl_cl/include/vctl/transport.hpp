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
#include "vctl/context.hpp"
#include "vctl/http_response.hpp"

namespace vctl {

// Where a POST goes: the TCP target, the name TLS verifies, and the path.
struct PostTarget {
    std::string   host;          // literal IP or DNS name to dial
    std::uint16_t port = 0;
    std::string   server_name;   // SNI + certificate name check
    std::string   path;          // "/v1.0.0/connect"
};

// One JSON POST per call. Implementations return transport errors only;
// HTTP status interpretation is up to the caller.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::error_code post(const Context& ctx,
                                 const PostTarget& target,
                                 const std::string& json_body,
                                 HttpResponse& out) = 0;
};

} // namespace vctl
