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
#include <system_error>
#include <vector>
#include <json/json.h>

namespace vctl {

// DNS/content filtering policy applied through the management endpoint.
struct Filter {
    bool ads        = false;
    bool trackers   = false;
    bool malware    = false;
    bool malicious  = false;
    int  pg         = 0;       // 0 (off), 12 or 18
    bool safe_search = false;

    std::vector<std::string> risk;        // "possible", "medium", "high"
    std::vector<std::string> illegal;     // "content", "warez", "spyware", "copyright"
    std::vector<std::string> categories;
    std::vector<std::string> whitelist;
    std::vector<std::string> blacklist;

    // Returns errc::invalid_filter on unknown values or malformed entries.
    std::error_code check() const;

    // Empty members are omitted.
    Json::Value to_json() const;
};

} // namespace vctl
