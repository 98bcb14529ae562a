/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include <system_error>
#include "vctl/client_config.hpp"
#include "vctl/pins.hpp"

namespace vctl::internal {

// TLS 1.3+ client context. Loads the configured CA bundle or the system
// roots and runs the pin check after standard chain verification on every
// handshake. Session resumption is off so each connection is verified.
class TlsClientContext {
public:
    // `pins` must outlive the context.
    TlsClientContext(const vctl::ClientConfig& cfg, const vctl::PinVerifier& pins);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // {} when usable, errc::tls_setup_failed or errc::ca_bundle_failed otherwise.
    std::error_code status() const { return _status; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    std::error_code _status;
    void log_last_error(const char* where);
};

} // namespace vctl::internal
