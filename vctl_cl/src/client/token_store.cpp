/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/token_store.hpp"
#include "vctl/internal/utils.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"

#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace {

bool write_owner_only(const std::string& path, const std::string& data) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) return false;
    std::size_t off = 0;
    bool ok = true;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) { ok = false; break; }
        off += (std::size_t)n;
    }
    if (::close(fd) != 0) ok = false;
    return ok;
}

} // namespace

namespace vctl::internal {

TokenStore::TokenStore(std::string path) : _path(std::move(path)) {
    if (_path.empty()) return;

    std::ifstream in(_path, std::ios::binary);
    if (!in.good()) {
        log_line("[TOKEN] no access token file at " + _path);
        return;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();
    trim_inplace(text);

    Bytes raw;
    if (text.empty() || !base64_decode(text, raw) || raw.empty()) {
        log_line("[TOKEN] ignoring undecodable access token in " + _path);
        return;
    }
    _token = std::move(raw);
}

std::error_code TokenStore::update(const std::string& token_b64) {
    Bytes raw;
    if (token_b64.empty() || !base64_decode(token_b64, raw) || raw.empty()) {
        return errc::bad_encoding;
    }
    _token = std::move(raw);

    if (!_path.empty() && !write_owner_only(_path, token_b64)) {
        log_line("[TOKEN] [ERR] writing " + _path + " failed: " + std::strerror(errno));
        return errc::token_write_failed;
    }
    return {};
}

} // namespace vctl::internal
