// SPDX-License-Identifier: Apache-2.0
// Part of the VpnCtl (VCTL) project.
// vctl_cl/src/client/http_low.cpp

#include "vctl/internal/http_low.hpp"
#include "vctl/internal/utils.hpp"
#include "vctl/error.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <algorithm>
#include <sstream>

namespace vctl::internal {

namespace {
constexpr int kPollSliceMs = 100;
}

std::error_code wait_fd(int fd, short events, const Context& ctx) {
    for (;;) {
        if (auto ec = ctx.err()) return ec;
        int slice = kPollSliceMs;
        const int rem = ctx.remaining_ms();
        if (rem >= 0) slice = std::min(slice, std::max(rem, 1));

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        const int pr = ::poll(&pfd, 1, slice);
        if (pr < 0) {
            if (errno == EINTR) continue;
            return std::error_code(errno, std::system_category());
        }
        if (pr == 0) continue;
        if (pfd.revents & (events | POLLERR | POLLHUP)) return {};
        if (pfd.revents & POLLNVAL) return std::error_code(EBADF, std::system_category());
    }
}

Socket::~Socket() { close(); }

Socket::Socket(Socket&& o) noexcept : _fd(o._fd) { o._fd = -1; }

Socket& Socket::operator=(Socket&& o) noexcept {
    if (this != &o) {
        close();
        _fd = o._fd;
        o._fd = -1;
    }
    return *this;
}

void Socket::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

std::error_code Socket::send_all(const Context& ctx, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        const ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n > 0) { off += (std::size_t)n; continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (auto ec = wait_fd(_fd, POLLOUT, ctx)) return ec;
            continue;
        }
        return std::error_code(errno ? errno : EPIPE, std::system_category());
    }
    return {};
}

std::error_code Socket::recv_some(const Context& ctx, char* d, std::size_t cap, std::size_t& n) {
    n = 0;
    for (;;) {
        const ssize_t r = ::recv(_fd, d, cap, 0);
        if (r >= 0) { n = (std::size_t)r; return {}; }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto ec = wait_fd(_fd, POLLIN, ctx)) return ec;
            continue;
        }
        return std::error_code(errno, std::system_category());
    }
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            headers[lower_copy(k)] = v;
        }
    }
    return true;
}

bool decode_chunked(const std::string& raw, std::string& body, bool& complete) {
    body.clear();
    complete = false;
    std::size_t pos = 0;
    for (;;) {
        const std::size_t eol = raw.find("\r\n", pos);
        if (eol == std::string::npos) return true; // need more data

        std::string size_line = raw.substr(pos, eol - pos);
        const std::size_t semi = size_line.find(';');
        if (semi != std::string::npos) size_line.resize(semi);
        trim_inplace(size_line);
        if (size_line.empty() || size_line.size() > 15) return false;

        std::size_t chunk = 0;
        for (char c : size_line) {
            int v = -1;
            if (c >= '0' && c <= '9') v = c - '0';
            else if (c >= 'a' && c <= 'f') v = 10 + (c - 'a');
            else if (c >= 'A' && c <= 'F') v = 10 + (c - 'A');
            if (v < 0) return false;
            chunk = (chunk << 4) | (std::size_t)v;
        }

        const std::size_t data = eol + 2;
        if (chunk == 0) {
            // Trailers end with an empty line.
            if (raw.find("\r\n\r\n", eol) != std::string::npos ||
                raw.compare(data, 2, "\r\n") == 0) {
                complete = true;
            }
            return true;
        }
        if (raw.size() < data + chunk + 2) return true;
        if (raw.compare(data + chunk, 2, "\r\n") != 0) return false;
        body.append(raw, data, chunk);
        pos = data + chunk + 2;
    }
}

std::string build_post_request(const std::string& host_header,
                               const std::string& path,
                               const std::string& user_agent,
                               const std::string& body)
{
    std::ostringstream req;
    req << "POST " << path << " HTTP/1.1\r\n";
    req << "Host: " << host_header << "\r\n";
    req << "User-Agent: " << user_agent << "\r\n";
    req << "Accept: */*\r\n";
    req << "Content-Type: application/json\r\n";
    req << "Content-Length: " << body.size() << "\r\n";
    req << "Connection: close\r\n";
    req << "\r\n";
    req << body;
    return req.str();
}

} // namespace vctl::internal
