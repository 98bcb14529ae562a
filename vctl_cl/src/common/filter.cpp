/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/filter.hpp"
#include "vctl/error.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace {

bool one_of(const std::string& v, std::initializer_list<const char*> allowed) {
    for (const char* a : allowed) if (v == a) return true;
    return false;
}

bool plain_entry(const std::string& v) {
    if (v.empty()) return false;
    return std::none_of(v.begin(), v.end(), [](char c){ return std::isspace((unsigned char)c); });
}

void put_list(Json::Value& root, const char* name, const std::vector<std::string>& items) {
    if (items.empty()) return;
    Json::Value arr(Json::arrayValue);
    for (const auto& i : items) arr.append(i);
    root[name] = arr;
}

} // namespace

namespace vctl {

std::error_code Filter::check() const {
    if (pg != 0 && pg != 12 && pg != 18) return errc::invalid_filter;
    for (const auto& r : risk) {
        if (!one_of(r, {"possible", "medium", "high"})) return errc::invalid_filter;
    }
    for (const auto& i : illegal) {
        if (!one_of(i, {"content", "warez", "spyware", "copyright"})) return errc::invalid_filter;
    }
    for (const auto* list : {&categories, &whitelist, &blacklist}) {
        if (!std::all_of(list->begin(), list->end(), plain_entry)) return errc::invalid_filter;
    }
    return {};
}

Json::Value Filter::to_json() const {
    Json::Value root(Json::objectValue);
    if (ads)         root["ads"] = true;
    if (trackers)    root["trackers"] = true;
    if (malware)     root["malware"] = true;
    if (malicious)   root["malicious"] = true;
    if (pg != 0)     root["PG"] = pg;
    if (safe_search) root["safeSearch"] = true;
    put_list(root, "risk", risk);
    put_list(root, "illegal", illegal);
    put_list(root, "categories", categories);
    put_list(root, "whitelist", whitelist);
    put_list(root, "blacklist", blacklist);
    return root;
}

} // namespace vctl
