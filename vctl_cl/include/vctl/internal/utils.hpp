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
#include <vector>
#include <cstddef>
#include <cstdint>

namespace vctl::internal {

void trim_inplace(std::string& s);
std::string lower_copy(std::string s);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on `sep`, trimming each item; empty items are dropped.
std::vector<std::string> split_trim(const std::string& s, char sep);

// Standard (padded) base64 via OpenSSL EVP_EncodeBlock/EVP_DecodeBlock.
std::string base64_encode(const std::string& bin);
bool base64_decode(const std::string& b64, std::string& out);

std::string sha256_bin(const unsigned char* p, std::size_t n);

// Uniform index in [0, n) drawn from RAND_bytes. n must be > 0.
std::size_t random_index(std::size_t n);

bool is_ip_literal(const std::string& s);
bool is_ipv6_literal(const std::string& s);

// "host:port" / "[v6]:port" split and join.
bool split_host_port(const std::string& addr, std::string& host, std::string& port);
std::string join_host_port(const std::string& host, std::uint16_t port);

} // namespace vctl::internal
