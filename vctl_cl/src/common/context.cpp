/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/context.hpp"
#include "vctl/error.hpp"

#include <limits>

namespace vctl {

Context Context::background() {
    Context c;
    c._flags.push_back(std::make_shared<std::atomic<bool>>(false));
    return c;
}

Context Context::with_cancel() const {
    Context c(*this);
    c._flags.push_back(std::make_shared<std::atomic<bool>>(false));
    return c;
}

Context Context::with_timeout(std::chrono::milliseconds d) const {
    Context c = with_cancel();
    const auto dl = clock::now() + d;
    if (!c._deadline || dl < *c._deadline) c._deadline = dl;
    return c;
}

void Context::cancel() const noexcept {
    if (!_flags.empty()) _flags.back()->store(true, std::memory_order_relaxed);
}

bool Context::cancelled() const noexcept {
    for (const auto& f : _flags) {
        if (f->load(std::memory_order_relaxed)) return true;
    }
    return false;
}

bool Context::expired() const noexcept {
    return static_cast<bool>(err());
}

std::error_code Context::err() const noexcept {
    if (cancelled()) return errc::cancelled;
    if (_deadline && clock::now() >= *_deadline) return errc::timed_out;
    return {};
}

int Context::remaining_ms() const noexcept {
    using namespace std::chrono;
    if (!_deadline) return -1;
    const auto now = clock::now();
    if (now >= *_deadline) return 0;
    const auto ms = duration_cast<milliseconds>(*_deadline - now).count();
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

} // namespace vctl
