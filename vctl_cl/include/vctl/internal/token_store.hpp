/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include <system_error>
#include "vctl/types.hpp"

namespace vctl::internal {

// In-memory access token, mirrored to a base64 text file when a path is set.
class TokenStore {
public:
    // Loads the file when `path` is non-empty. A missing or undecodable file
    // leaves the token absent (first run is a normal state).
    explicit TokenStore(std::string path);

    bool have() const { return _token.has_value(); }
    const std::optional<Bytes>& token() const { return _token; }
    const std::string& path() const { return _path; }

    // Adopt a freshly issued token given as base64 text.
    //  - errc::bad_encoding: nothing changed
    //  - errc::token_write_failed: memory updated, file not
    std::error_code update(const std::string& token_b64);

private:
    std::string _path;
    std::optional<Bytes> _token;
};

} // namespace vctl::internal
