/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>

namespace vctl {

// Thread-safe logging (to stdout, plus a file once set_log_file() names one).
void set_log_file(const std::string& path);

// Replace stdout/file output with a custom sink; an empty function restores it.
void set_log_sink(std::function<void(const std::string&)> sink);

void log_line(const std::string& line);

} // namespace vctl
