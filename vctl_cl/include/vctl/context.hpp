/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace vctl {

// Cancellation + deadline scope for blocking calls.
// Children observe their parents' cancellation and inherit the earliest
// deadline; cancelling a child never cancels the parent.
// Copies share the same cancellation flags.
class Context {
public:
    using clock = std::chrono::steady_clock;

    // Root context: no deadline, cancellable.
    static Context background();

    Context with_timeout(std::chrono::milliseconds d) const;
    Context with_cancel() const;

    // Safe to call from a signal handler.
    void cancel() const noexcept;

    bool cancelled() const noexcept;
    bool expired() const noexcept;

    // {} while usable, errc::cancelled or errc::timed_out once done.
    std::error_code err() const noexcept;

    // Milliseconds until the deadline clamped to [0, INT_MAX]; -1 when unbounded.
    int remaining_ms() const noexcept;

    const std::optional<clock::time_point>& deadline() const noexcept { return _deadline; }

private:
    Context() = default;

    std::vector<std::shared_ptr<std::atomic<bool>>> _flags;
    std::optional<clock::time_point> _deadline;
};

} // namespace vctl
