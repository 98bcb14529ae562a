/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/dns.hpp"
#include "vctl/internal/utils.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace {

constexpr std::size_t kDnsHeaderLen = 12;
constexpr std::size_t kMaxNameLen   = 253;
constexpr std::size_t kMaxLabelLen  = 63;
constexpr int kRcodeNxDomain        = 3;

void put16(std::string& out, std::uint16_t v) {
    out.push_back((char)((v >> 8) & 0xFF));
    out.push_back((char)(v & 0xFF));
}

std::uint16_t get16(const std::string& m, std::size_t off) {
    return (std::uint16_t)(((unsigned char)m[off] << 8) | (unsigned char)m[off + 1]);
}

// Advance past a possibly compressed domain name.
bool skip_name(const std::string& m, std::size_t& off) {
    while (off < m.size()) {
        const unsigned char len = (unsigned char)m[off];
        if (len == 0) { off += 1; return true; }
        if ((len & 0xC0) == 0xC0) {
            if (off + 2 > m.size()) return false;
            off += 2;
            return true;
        }
        if (len & 0xC0) return false; // reserved label types
        off += 1 + len;
    }
    return false;
}

} // namespace

namespace vctl::internal {

bool build_dns_query(const std::string& host, std::uint16_t qtype, std::uint16_t id, std::string& out) {
    std::string name = host;
    if (!name.empty() && name.back() == '.') name.pop_back();
    if (name.empty() || name.size() > kMaxNameLen) return false;

    out.clear();
    out.reserve(kDnsHeaderLen + name.size() + 6);
    put16(out, id);
    put16(out, 0x0100);  // standard query, RD=1
    put16(out, 1);       // QDCOUNT
    put16(out, 0);       // ANCOUNT
    put16(out, 0);       // NSCOUNT
    put16(out, 0);       // ARCOUNT

    std::size_t p = 0;
    while (p <= name.size()) {
        std::size_t dot = name.find('.', p);
        if (dot == std::string::npos) dot = name.size();
        const std::size_t len = dot - p;
        if (len == 0 || len > kMaxLabelLen) return false;
        out.push_back((char)len);
        out.append(name, p, len);
        p = dot + 1;
    }
    out.push_back(0);

    put16(out, qtype);
    put16(out, 1);       // QCLASS IN
    return true;
}

bool parse_dns_response(const std::string& msg, std::uint16_t id, std::uint16_t qtype, DnsAnswer& out) {
    out = DnsAnswer{};
    if (msg.size() < kDnsHeaderLen) return false;
    if (get16(msg, 0) != id) return false;

    const std::uint16_t flags = get16(msg, 2);
    if ((flags & 0x8000) == 0) return false;  // not a response
    out.truncated = (flags & 0x0200) != 0;
    out.rcode = flags & 0x000F;

    const std::uint16_t qd = get16(msg, 4);
    const std::uint16_t an = get16(msg, 6);

    std::size_t off = kDnsHeaderLen;
    for (std::uint16_t i = 0; i < qd; ++i) {
        if (!skip_name(msg, off) || off + 4 > msg.size()) return false;
        off += 4;
    }

    for (std::uint16_t i = 0; i < an; ++i) {
        if (!skip_name(msg, off) || off + 10 > msg.size()) return false;
        const std::uint16_t type  = get16(msg, off);
        const std::uint16_t klass = get16(msg, off + 2);
        const std::uint16_t rdlen = get16(msg, off + 8);
        off += 10;
        if (off + rdlen > msg.size()) return false;

        if (type == qtype && klass == 1) {
            char buf[INET6_ADDRSTRLEN] = {0};
            if (type == kDnsTypeA && rdlen == 4) {
                if (::inet_ntop(AF_INET, msg.data() + off, buf, sizeof(buf))) out.ips.emplace_back(buf);
            } else if (type == kDnsTypeAAAA && rdlen == 16) {
                if (::inet_ntop(AF_INET6, msg.data() + off, buf, sizeof(buf))) out.ips.emplace_back(buf);
            } else {
                return false;
            }
        }
        off += rdlen;
    }
    return true;
}

std::error_code DnsLookup::query(const Context& ctx, const std::string& host, std::uint16_t qtype,
                                 std::vector<std::string>& out) const
{
    out.clear();
    const std::uint16_t id = (std::uint16_t)random_index(0x10000);
    std::string q;
    if (!build_dns_query(host, qtype, id, q)) {
        log_line("[DNS] cannot encode query for " + host);
        return errc::dns_lookup_failed;
    }

    Socket s;
    if (auto ec = _dialer.dial(ctx, Network::Udp, _dialer.dns_servers().front(), s)) return ec;
    if (auto ec = s.send_all(ctx, q.data(), q.size())) return ec;

    std::string buf;
    for (;;) {
        buf.resize(4096);
        std::size_t n = 0;
        if (auto ec = s.recv_some(ctx, &buf[0], buf.size(), n)) return ec;
        buf.resize(n);

        DnsAnswer ans;
        if (!parse_dns_response(buf, id, qtype, ans)) {
            // A reply to our id that fails to parse ends the query; anything else is stray.
            if (buf.size() >= kDnsHeaderLen && get16(buf, 0) == id && (get16(buf, 2) & 0x8000)) {
                log_line("[DNS] malformed response for " + host);
                return errc::dns_bad_response;
            }
            continue;
        }

        if (ans.rcode == kRcodeNxDomain) return errc::dns_no_such_host;
        if (ans.rcode != 0) {
            log_line("[DNS] " + host + " rcode " + std::to_string(ans.rcode));
            return errc::dns_lookup_failed;
        }
        if (ans.truncated && ans.ips.empty()) return errc::dns_bad_response;
        out = std::move(ans.ips);
        return {};
    }
}

std::error_code DnsLookup::lookup_ip(const Context& ctx, const std::string& host,
                                     std::vector<std::string>& out) const
{
    out.clear();
    std::vector<std::string> v4, v6;
    const std::error_code e4 = query(ctx, host, kDnsTypeA, v4);
    const std::error_code e6 = query(ctx, host, kDnsTypeAAAA, v6);

    out.insert(out.end(), v4.begin(), v4.end());
    out.insert(out.end(), v6.begin(), v6.end());
    if (!out.empty()) return {};

    if (e4 == errc::dns_no_such_host || e6 == errc::dns_no_such_host) return errc::dns_no_such_host;
    if (e4) return e4;
    return e6;
}

} // namespace vctl::internal
