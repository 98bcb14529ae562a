/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <system_error>
#include <type_traits>

namespace vctl {

// Error codes returned by every fallible client operation.
enum class errc {
    // validation (no I/O performed)
    invalid_host = 1,
    invalid_domain,
    invalid_access_token,
    invalid_public_key,
    invalid_session_token,
    missing_credentials,
    invalid_filter,
    not_resolved,

    // resolution
    dns_lookup_failed,
    dns_no_such_host,
    dns_bad_response,
    dns_no_address,
    dns_no_ip,

    // transport
    dial_failed,
    tls_setup_failed,
    tls_handshake_failed,
    tls_verify_failed,
    bad_pin,
    io_failed,
    bad_http_response,
    timed_out,
    cancelled,
    ca_bundle_failed,

    // protocol
    update_required,
    bad_http_status,
    filter_failed,

    // decode
    bad_json,
    bad_encoding,

    // persistence
    token_write_failed
};

// Coarse categories. Compare with `ec == vctl::error_kind::protocol`.
// Socket errors from the system category count as transport errors.
enum class error_kind {
    validation = 1,
    resolution,
    transport,
    protocol,
    decode,
    persistence
};

const std::error_category& error_category() noexcept;
const std::error_category& error_kind_category() noexcept;

std::error_code make_error_code(errc e) noexcept;
std::error_condition make_error_condition(error_kind k) noexcept;

} // namespace vctl

namespace std {
template <> struct is_error_code_enum<vctl::errc> : true_type {};
template <> struct is_error_condition_enum<vctl::error_kind> : true_type {};
} // namespace std
