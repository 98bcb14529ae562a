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
#include <string>
#include <system_error>
#include "vctl/client_config.hpp"
#include "vctl/pins.hpp"
#include "vctl/transport.hpp"
#include "vctl/internal/dialer.hpp"
#include "vctl/internal/tls_cli_ctx.hpp"

namespace vctl::internal {

// HTTPS over OpenSSL with the client's Dialer. No keep-alive: each post()
// dials, handshakes (running the pin check), sends one HTTP/1.1 request
// with "Connection: close" and reads one response.
class HttpsTransport : public vctl::Transport {
public:
    // `dialer` and `pins` must outlive the transport.
    HttpsTransport(const vctl::ClientConfig& cfg, const Dialer& dialer, const vctl::PinVerifier& pins);

    std::error_code status() const { return _tls.status(); }

    std::error_code post(const Context& ctx,
                         const PostTarget& target,
                         const std::string& json_body,
                         HttpResponse& out) override;

private:
    const Dialer& _dialer;
    TlsClientContext _tls;
    std::string _user_agent;
    std::chrono::seconds _handshake_timeout;
    std::chrono::seconds _header_timeout;
};

} // namespace vctl::internal
