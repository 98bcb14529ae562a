/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/tls_cli_ctx.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

namespace {

// Standard chain verification first, then the pins on the chain it built.
int verify_with_pins(X509_STORE_CTX* sctx, void* arg) {
    if (X509_verify_cert(sctx) != 1) return 0;

    const auto* pins = static_cast<const vctl::PinVerifier*>(arg);
    if (!pins || pins->verify_chain(X509_STORE_CTX_get0_chain(sctx))) {
        X509_STORE_CTX_set_error(sctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
    return 1;
}

// ALPN wire format: length-prefixed protocol ids.
const unsigned char kAlpn[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

} // namespace

namespace vctl::internal {

TlsClientContext::TlsClientContext(const vctl::ClientConfig& cfg, const vctl::PinVerifier& pins) {
    OPENSSL_init_ssl(0, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        _status = errc::tls_setup_failed;
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_3_VERSION)) {
        log_last_error("set_min_proto");
        _status = errc::tls_setup_failed;
        return;
    }

    // Trust store
    if (!cfg.ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.ca_file.c_str(), nullptr) != 1) {
            log_last_error("load_verify_locations(CA)");
            vctl::log_line("[TLS-CLI] Bad certificate in " + cfg.ca_file);
            _status = errc::ca_bundle_failed;
            return;
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_last_error("set_default_verify_paths");
        }
    }

    SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_cert_verify_callback(_ctx, verify_with_pins,
                                     const_cast<vctl::PinVerifier*>(&pins));

    // set_alpn_protos returns 0 on success
    if (SSL_CTX_set_alpn_protos(_ctx, kAlpn, sizeof(kAlpn)) != 0) {
        log_last_error("set_alpn_protos");
    }

    // Fresh handshake per request: resumed sessions skip certificate checks.
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_OFF);
    auto opts = SSL_OP_NO_TICKET;
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    opts |= SSL_OP_IGNORE_UNEXPECTED_EOF;
#endif
    SSL_CTX_set_options(_ctx, opts);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::log_last_error(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        vctl::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
}

} // namespace vctl::internal
