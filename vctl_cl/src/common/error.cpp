/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/error.hpp"
#include <string>

namespace {

int kind_of(vctl::errc e) {
    using vctl::errc;
    using vctl::error_kind;
    switch (e) {
    case errc::invalid_host:
    case errc::invalid_domain:
    case errc::invalid_access_token:
    case errc::invalid_public_key:
    case errc::invalid_session_token:
    case errc::missing_credentials:
    case errc::invalid_filter:
    case errc::not_resolved:
        return (int)error_kind::validation;
    case errc::dns_lookup_failed:
    case errc::dns_no_such_host:
    case errc::dns_bad_response:
    case errc::dns_no_address:
    case errc::dns_no_ip:
        return (int)error_kind::resolution;
    case errc::dial_failed:
    case errc::tls_setup_failed:
    case errc::tls_handshake_failed:
    case errc::tls_verify_failed:
    case errc::bad_pin:
    case errc::io_failed:
    case errc::bad_http_response:
    case errc::timed_out:
    case errc::cancelled:
    case errc::ca_bundle_failed:
        return (int)error_kind::transport;
    case errc::update_required:
    case errc::bad_http_status:
    case errc::filter_failed:
        return (int)error_kind::protocol;
    case errc::bad_json:
    case errc::bad_encoding:
        return (int)error_kind::decode;
    case errc::token_write_failed:
        return (int)error_kind::persistence;
    }
    return 0;
}

class ErrcCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "vctl"; }

    std::string message(int ev) const override {
        using vctl::errc;
        switch ((errc)ev) {
        case errc::invalid_host:          return "invalid host name";
        case errc::invalid_domain:        return "invalid domain";
        case errc::invalid_access_token:  return "invalid access token";
        case errc::invalid_public_key:    return "wrong public key length";
        case errc::invalid_session_token: return "missing session token";
        case errc::missing_credentials:   return "neither access token nor username/password set";
        case errc::invalid_filter:        return "invalid filter settings";
        case errc::not_resolved:          return "remote endpoint not resolved";
        case errc::dns_lookup_failed:     return "dns lookup failed";
        case errc::dns_no_such_host:      return "no such host";
        case errc::dns_bad_response:      return "malformed dns response";
        case errc::dns_no_address:        return "dns lookup returned no addresses";
        case errc::dns_no_ip:             return "no IP found";
        case errc::dial_failed:           return "dial failed";
        case errc::tls_setup_failed:      return "TLS setup failed";
        case errc::tls_handshake_failed:  return "TLS handshake failed";
        case errc::tls_verify_failed:     return "TLS certificate verification failed";
        case errc::bad_pin:               return "bad public key PIN";
        case errc::io_failed:             return "connection I/O failed";
        case errc::bad_http_response:     return "malformed HTTP response";
        case errc::timed_out:             return "operation timed out";
        case errc::cancelled:             return "operation cancelled";
        case errc::ca_bundle_failed:      return "bad CA certificate bundle";
        case errc::update_required:       return "application update required";
        case errc::bad_http_status:       return "bad HTTP status";
        case errc::filter_failed:         return "filter failed";
        case errc::bad_json:              return "malformed JSON";
        case errc::bad_encoding:          return "bad base64 encoding";
        case errc::token_write_failed:    return "access token file write failed";
        }
        return "unknown vctl error " + std::to_string(ev);
    }

    std::error_condition default_error_condition(int ev) const noexcept override {
        const int k = kind_of((vctl::errc)ev);
        if (k == 0) return std::error_condition(ev, *this);
        return std::error_condition(k, vctl::error_kind_category());
    }
};

class KindCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "vctl-kind"; }

    std::string message(int ev) const override {
        switch ((vctl::error_kind)ev) {
        case vctl::error_kind::validation:  return "validation error";
        case vctl::error_kind::resolution:  return "resolution error";
        case vctl::error_kind::transport:   return "transport error";
        case vctl::error_kind::protocol:    return "protocol error";
        case vctl::error_kind::decode:      return "decode error";
        case vctl::error_kind::persistence: return "persistence error";
        }
        return "unknown error kind";
    }

    bool equivalent(const std::error_code& code, int condition) const noexcept override {
        if (code.category() == vctl::error_category()) {
            return kind_of((vctl::errc)code.value()) == condition;
        }
        if (code.category() == std::system_category() || code.category() == std::generic_category()) {
            return condition == (int)vctl::error_kind::transport;
        }
        return false;
    }
};

} // namespace

namespace vctl {

const std::error_category& error_category() noexcept {
    static const ErrcCategory cat;
    return cat;
}

const std::error_category& error_kind_category() noexcept {
    static const KindCategory cat;
    return cat;
}

std::error_code make_error_code(errc e) noexcept {
    return std::error_code((int)e, error_category());
}

std::error_condition make_error_condition(error_kind k) noexcept {
    return std::error_condition((int)k, error_kind_category());
}

} // namespace vctl
