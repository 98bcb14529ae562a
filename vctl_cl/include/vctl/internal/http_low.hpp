/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <cstddef>
#include <system_error>
#include "vctl/context.hpp"

namespace vctl::internal {

// Wait until fd is ready for `events` (POLLIN/POLLOUT), polling in short
// slices so cancellation of ctx is noticed.
std::error_code wait_fd(int fd, short events, const Context& ctx);

// RAII non-blocking socket with context-bounded send/recv helpers.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : _fd(fd) {}
    ~Socket();

    Socket(Socket&& o) noexcept;
    Socket& operator=(Socket&& o) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    void close();
    int  fd() const { return _fd; }
    bool is_open() const { return _fd >= 0; }

    std::error_code send_all(const Context& ctx, const char* d, std::size_t len);
    // n == 0 on orderly shutdown by the peer.
    std::error_code recv_some(const Context& ctx, char* d, std::size_t cap, std::size_t& n);

private:
    int _fd = -1;
};

// Parse an HTTP/1.x status line and headers. Header names are stored lower-case.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

// Decode a chunked body. `complete` is set once the terminating chunk was seen.
// Returns false on malformed framing.
bool decode_chunked(const std::string& raw, std::string& body, bool& complete);

std::string build_post_request(const std::string& host_header,
                               const std::string& path,
                               const std::string& user_agent,
                               const std::string& body);

} // namespace vctl::internal
