/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/dialer.hpp"
#include "vctl/internal/utils.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace vctl::internal {

std::vector<std::string> parse_dns_servers(const std::string& csv) {
    std::vector<std::string> out;
    for (auto& item : split_trim(csv, ',')) {
        std::string h, p;
        if (split_host_port(item, h, p)) {
            out.push_back(item);
        } else {
            // Bare address: default DNS port.
            if (!item.empty() && item.front() == '[' && item.back() == ']') {
                item = item.substr(1, item.size() - 2);
            }
            out.push_back(join_host_port(item, 53));
        }
    }
    if (out.empty()) out.push_back("1.1.1.1:53");
    return out;
}

Dialer::Dialer(int firewall_mark, std::vector<std::string> dns_servers, IndexSource pick)
    : _mark(firewall_mark), _dns_servers(std::move(dns_servers)), _pick(std::move(pick))
{
    if (_dns_servers.empty()) _dns_servers.push_back("1.1.1.1:53");
    if (!_pick) _pick = [](std::size_t n) { return random_index(n); };
}

const std::string& Dialer::pick_dns_server() const {
    std::size_t i = _pick(_dns_servers.size());
    if (i >= _dns_servers.size()) i = 0;
    return _dns_servers[i];
}

std::error_code Dialer::dial(const Context& ctx, Network net, const std::string& address, Socket& out) const {
    out.close();
    if (auto ec = ctx.err()) return ec;

    const std::string& target = (net == Network::Udp) ? pick_dns_server() : address;

    std::string host, port;
    if (!split_host_port(target, host, port)) {
        log_line("[DIAL] bad address " + target);
        return errc::dial_failed;
    }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = (net == Network::Udp) ? SOCK_DGRAM : SOCK_STREAM;
    hints.ai_flags    = AI_NUMERICSERV;
    if (is_ip_literal(host)) hints.ai_flags |= AI_NUMERICHOST;

    addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        log_line(std::string("[DIAL] getaddrinfo ") + host + " failed: " + gai_strerror(rc));
        return errc::dial_failed;
    }

    std::error_code last = errc::dial_failed;
    for (auto* p = res; p; p = p->ai_next) {
        last = dial_addr(ctx, p->ai_family, p->ai_socktype, p->ai_protocol,
                         p->ai_addr, p->ai_addrlen, out);
        if (!last) break;
        if (last == errc::cancelled || last == errc::timed_out) break;
    }
    ::freeaddrinfo(res);

    if (last) log_line("[DIAL] " + target + " failed: " + last.message());
    return last;
}

std::error_code Dialer::dial_addr(const Context& ctx, int family, int socktype, int protocol,
                                  const sockaddr* sa, socklen_t sa_len, Socket& out) const
{
    Socket s(::socket(family, socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, protocol));
    if (!s.is_open()) return std::error_code(errno, std::system_category());

    if (_mark > 0) {
        if (::setsockopt(s.fd(), SOL_SOCKET, SO_MARK, &_mark, sizeof(_mark)) != 0) {
            log_line(std::string("[DIAL] [ERR] Set mark failed, ") + std::strerror(errno));
        }
    }

    if (::connect(s.fd(), sa, sa_len) != 0) {
        if (errno != EINPROGRESS) return std::error_code(errno, std::system_category());
        if (auto ec = wait_fd(s.fd(), POLLOUT, ctx)) return ec;

        int soerr = 0;
        socklen_t slen = sizeof(soerr);
        if (::getsockopt(s.fd(), SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0) {
            return std::error_code(errno, std::system_category());
        }
        if (soerr != 0) return std::error_code(soerr, std::system_category());
    }

    if (socktype == SOCK_STREAM) {
        int one = 1;
        (void)::setsockopt(s.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }

    out = std::move(s);
    return {};
}

} // namespace vctl::internal
