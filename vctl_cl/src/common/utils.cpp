/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/internal/utils.hpp"
#include "vctl/types.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <arpa/inet.h>

namespace vctl::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_trim(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::size_t p = 0;
    while (p <= s.size()) {
        std::size_t q = s.find(sep, p);
        if (q == std::string::npos) q = s.size();
        std::string item = s.substr(p, q - p);
        trim_inplace(item);
        if (!item.empty()) out.push_back(std::move(item));
        p = q + 1;
    }
    return out;
}

std::string base64_encode(const std::string& bin) {
    if (bin.empty()) return {};
    std::string out;
    out.resize(4 * ((bin.size() + 2) / 3));
    const int n = EVP_EncodeBlock((unsigned char*)out.data(),
                                  (const unsigned char*)bin.data(), (int)bin.size());
    out.resize(n < 0 ? 0 : (std::size_t)n);
    return out;
}

bool base64_decode(const std::string& b64, std::string& out) {
    out.clear();
    if (b64.empty()) return true;
    if (b64.size() % 4 != 0) return false;
    if (b64.size() > (std::size_t)std::numeric_limits<int>::max()) return false;

    // EVP_DecodeBlock tolerates surrounding whitespace; the padded
    // standard alphabet is all we accept.
    for (char c : b64) {
        const bool ok = std::isalnum((unsigned char)c) || c == '+' || c == '/' || c == '=';
        if (!ok) return false;
    }
    std::size_t pad = 0;
    if (b64[b64.size()-1] == '=') ++pad;
    if (b64[b64.size()-2] == '=') ++pad;
    if (b64.find('=') < b64.size() - pad) return false;

    std::string tmp;
    tmp.resize(3 * (b64.size() / 4));
    const int n = EVP_DecodeBlock((unsigned char*)tmp.data(),
                                  (const unsigned char*)b64.data(), (int)b64.size());
    if (n < 0 || (std::size_t)n < pad) return false;
    tmp.resize((std::size_t)n - pad);
    out.swap(tmp);
    return true;
}

std::string sha256_bin(const unsigned char* p, std::size_t n) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256(p, n, d);
    return std::string((const char*)d, SHA256_DIGEST_LENGTH);
}

std::size_t random_index(std::size_t n) {
    if (n <= 1) return 0;
    // Rejection sampling keeps the draw uniform.
    const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() -
                                (std::numeric_limits<std::uint64_t>::max() % n);
    for (;;) {
        std::uint64_t v = 0;
        if (RAND_bytes((unsigned char*)&v, sizeof(v)) != 1) return 0;
        if (v < limit) return (std::size_t)(v % n);
    }
}

bool is_ipv6_literal(const std::string& s) {
    unsigned char tmp[16];
    return ::inet_pton(AF_INET6, s.c_str(), tmp) == 1;
}

bool is_ip_literal(const std::string& s) {
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, s.c_str(), tmp) == 1 || is_ipv6_literal(s);
}

bool split_host_port(const std::string& addr, std::string& host, std::string& port) {
    if (!addr.empty() && addr[0] == '[') {
        const std::size_t rb = addr.find(']');
        if (rb == std::string::npos || rb + 1 >= addr.size() || addr[rb+1] != ':') return false;
        host = addr.substr(1, rb - 1);
        port = addr.substr(rb + 2);
    } else {
        const std::size_t c = addr.rfind(':');
        if (c == std::string::npos) return false;
        host = addr.substr(0, c);
        if (host.find(':') != std::string::npos) return false; // bare v6 needs brackets
        port = addr.substr(c + 1);
    }
    if (host.empty() || port.empty()) return false;
    return std::all_of(port.begin(), port.end(), [](char c){ return std::isdigit((unsigned char)c); });
}

std::string join_host_port(const std::string& host, std::uint16_t port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

} // namespace vctl::internal

namespace vctl {

std::string Endpoint::to_string() const {
    return internal::join_host_port(ip, port);
}

} // namespace vctl
