/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/https_transport.hpp"
#include "vctl/internal/http_low.hpp"
#include "vctl/internal/utils.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <memory>
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace {

constexpr std::size_t kMaxHeaderBytes = 1u << 20;
constexpr std::size_t kMaxBodyBytes   = 4u << 20;

using SslPtr = std::unique_ptr<SSL, void(*)(SSL*)>;

// Drain OpenSSL error stack into logs.
void log_openssl_errors(const char* where) {
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        vctl::log_line(std::string("[REST] ") + where + ": " + buf);
    }
}

// After an SSL_* call returned rc <= 0: wait for the I/O OpenSSL asked for
// (retry = true) or turn the failure into an error code.
std::error_code ssl_wait(SSL* ssl, int fd, int rc, const vctl::Context& ctx, bool& retry) {
    retry = false;
    const int ssl_err = ::SSL_get_error(ssl, rc);
    if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
        const short ev = (ssl_err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
        if (auto ec = vctl::internal::wait_fd(fd, ev, ctx)) return ec;
        retry = true;
        return {};
    }
    if (ssl_err == SSL_ERROR_SYSCALL) {
        const int e = errno;
        if (e == EINTR) { retry = true; return {}; }
        if (e != 0) return std::error_code(e, std::system_category());
        return vctl::errc::io_failed;
    }
    return vctl::errc::io_failed;
}

// TLS handshake on a non-blocking socket, bounded by ctx.
std::error_code ssl_connect_with_ctx(SSL* ssl, int fd, const vctl::Context& ctx) {
    for (;;) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) return {};

        const int ssl_err = ::SSL_get_error(ssl, rc);
        if (ssl_err == SSL_ERROR_SSL) {
            const long vr = ::SSL_get_verify_result(ssl);
            if (vr == X509_V_ERR_APPLICATION_VERIFICATION) {
                vctl::log_line("[REST] [ERR] TLS handshake rejected: bad public key PIN");
                ::ERR_clear_error();
                return vctl::errc::bad_pin;
            }
            if (vr != X509_V_OK) {
                vctl::log_line(std::string("[REST] [ERR] TLS verify failed: ") +
                               ::X509_verify_cert_error_string(vr));
                ::ERR_clear_error();
                return vctl::errc::tls_verify_failed;
            }
            log_openssl_errors("SSL_connect");
            return vctl::errc::tls_handshake_failed;
        }

        bool retry = false;
        std::error_code ec = ssl_wait(ssl, fd, rc, ctx, retry);
        if (ec) {
            if (ec == vctl::errc::io_failed) return vctl::errc::tls_handshake_failed;
            return ec;
        }
        if (!retry) return vctl::errc::tls_handshake_failed;
    }
}

std::error_code ssl_write_all(SSL* ssl, int fd, const std::string& data, const vctl::Context& ctx) {
    std::size_t off = 0;
    while (off < data.size()) {
        ::ERR_clear_error();
        const int n = ::SSL_write(ssl, data.data() + off, (int)std::min<std::size_t>(data.size() - off, 1u << 16));
        if (n > 0) { off += (std::size_t)n; continue; }
        bool retry = false;
        if (auto ec = ssl_wait(ssl, fd, n, ctx, retry)) return ec;
        if (!retry) return vctl::errc::io_failed;
    }
    return {};
}

// n == 0 means the peer closed the TLS stream.
std::error_code ssl_read_some(SSL* ssl, int fd, char* buf, int cap, const vctl::Context& ctx, std::size_t& n) {
    n = 0;
    for (;;) {
        ::ERR_clear_error();
        const int rc = ::SSL_read(ssl, buf, cap);
        if (rc > 0) { n = (std::size_t)rc; return {}; }
        if (::SSL_get_error(ssl, rc) == SSL_ERROR_ZERO_RETURN) return {};
        bool retry = false;
        if (auto ec = ssl_wait(ssl, fd, rc, ctx, retry)) return ec;
        if (!retry) return vctl::errc::io_failed;
    }
}

bool header_has_token(const std::string& value, const char* token) {
    return vctl::internal::lower_copy(value).find(token) != std::string::npos;
}

} // namespace

namespace vctl::internal {

HttpsTransport::HttpsTransport(const vctl::ClientConfig& cfg, const Dialer& dialer, const vctl::PinVerifier& pins)
    : _dialer(dialer),
      _tls(cfg, pins),
      _user_agent(cfg.user_agent),
      _handshake_timeout(std::max(1, cfg.tls_handshake_timeout_sec)),
      _header_timeout(std::max(1, cfg.response_header_timeout_sec)) {}

std::error_code HttpsTransport::post(const Context& ctx,
                                     const PostTarget& target,
                                     const std::string& json_body,
                                     HttpResponse& out)
{
    out = HttpResponse{};
    if (auto ec = _tls.status()) return ec;

    Socket sock;
    const std::string addr = join_host_port(target.host, target.port);
    if (auto ec = _dialer.dial(ctx, Network::Tcp, addr, sock)) return ec;

    SslPtr ssl(::SSL_new(_tls.ctx()), [](SSL* s){ if (s) ::SSL_free(s); });
    if (!ssl) {
        log_openssl_errors("SSL_new");
        return errc::tls_setup_failed;
    }
    if (::SSL_set_fd(ssl.get(), sock.fd()) != 1) {
        log_openssl_errors("SSL_set_fd");
        return errc::tls_setup_failed;
    }

    // Certificate chain validation is not enough; the name must match too.
    const std::string name = target.server_name.empty() ? target.host : target.server_name;
    if (is_ip_literal(name)) {
        if (::X509_VERIFY_PARAM_set1_ip_asc(::SSL_get0_param(ssl.get()), name.c_str()) != 1) {
            log_openssl_errors("X509_VERIFY_PARAM_set1_ip_asc");
            return errc::tls_setup_failed;
        }
    } else {
        if (::SSL_set_tlsext_host_name(ssl.get(), name.c_str()) != 1 ||
            ::SSL_set1_host(ssl.get(), name.c_str()) != 1) {
            log_openssl_errors("SSL_set1_host");
            return errc::tls_setup_failed;
        }
    }

    const int fd = sock.fd();
    if (auto ec = ssl_connect_with_ctx(ssl.get(), fd, ctx.with_timeout(_handshake_timeout))) {
        // The handshake deadline is its own scope; report the caller's state if that ended.
        if (ec == errc::timed_out && !ctx.expired()) {
            log_line("[REST] [ERR] TLS handshake timeout with " + addr);
        }
        return ec;
    }

    // Host carries the dialed authority; the certificate name travels in SNI only.
    const std::string host_header = join_host_port(target.host, target.port);
    const std::string request = build_post_request(host_header, target.path, _user_agent, json_body);
    if (auto ec = ssl_write_all(ssl.get(), fd, request, ctx)) return ec;

    // Response header, bounded by its own timeout.
    std::string buf;
    char chunk[4096];
    std::size_t n = 0;
    {
        const Context hdr_ctx = ctx.with_timeout(_header_timeout);
        while (buf.find("\r\n\r\n") == std::string::npos) {
            if (auto ec = ssl_read_some(ssl.get(), fd, chunk, sizeof(chunk), hdr_ctx, n)) return ec;
            if (n == 0) return errc::bad_http_response;
            buf.append(chunk, n);
            if (buf.size() > kMaxHeaderBytes) return errc::bad_http_response;
        }
    }

    std::size_t hdr_end = 0;
    if (!parse_http_response(buf, hdr_end, out.status_code, out.status_text, out.headers)) {
        return errc::bad_http_response;
    }
    std::string raw = buf.substr(hdr_end);

    const auto te = out.headers.find("transfer-encoding");
    const auto cl = out.headers.find("content-length");
    const bool chunked = (te != out.headers.end() && header_has_token(te->second, "chunked"));

    if (chunked) {
        bool complete = false;
        for (;;) {
            if (!decode_chunked(raw, out.body, complete)) return errc::bad_http_response;
            if (complete) break;
            if (auto ec = ssl_read_some(ssl.get(), fd, chunk, sizeof(chunk), ctx, n)) return ec;
            if (n == 0) return errc::bad_http_response;
            raw.append(chunk, n);
            if (raw.size() > kMaxBodyBytes) return errc::bad_http_response;
        }
    } else if (cl != out.headers.end()) {
        std::size_t content_len = 0;
        try { content_len = (std::size_t)std::stoull(cl->second); }
        catch (const std::exception&) { return errc::bad_http_response; }
        if (content_len > kMaxBodyBytes) return errc::bad_http_response;

        while (raw.size() < content_len) {
            if (auto ec = ssl_read_some(ssl.get(), fd, chunk, sizeof(chunk), ctx, n)) return ec;
            if (n == 0) return errc::bad_http_response;
            raw.append(chunk, n);
        }
        raw.resize(content_len);
        out.body.swap(raw);
    } else {
        // Connection: close framing.
        for (;;) {
            if (auto ec = ssl_read_some(ssl.get(), fd, chunk, sizeof(chunk), ctx, n)) return ec;
            if (n == 0) break;
            raw.append(chunk, n);
            if (raw.size() > kMaxBodyBytes) return errc::bad_http_response;
        }
        out.body.swap(raw);
    }

    (void)::SSL_shutdown(ssl.get());
    return {};
}

} // namespace vctl::internal
