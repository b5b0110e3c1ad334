#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace stream {

// ---------------------------------------------------------------------------
// StageState -- lifecycle shared by every stage
// ---------------------------------------------------------------------------
//   NOT_STARTED -> RUNNING -> { COMPLETED | FAULTED } -> CLOSED
//
// CLOSED is reached once both output channels are closed (and, for a
// transform stage, its finalizer has run).  A stage is never restarted.
// ---------------------------------------------------------------------------
enum class StageState : uint8_t {
    NOT_STARTED = 0,
    RUNNING     = 1,
    COMPLETED   = 2,
    FAULTED     = 3,
    CLOSED      = 4,
};

[[nodiscard]] std::string_view stage_state_string(StageState state) noexcept;

/// Render the exception currently being handled for a fault report.
/// Must be called from inside a catch block.
[[nodiscard]] std::string describe_current_exception();

// ---------------------------------------------------------------------------
// CleanupGuard -- runs a stage task's cleanup path when the task body
// leaves its scope, whether it returns or unwinds.  The callable must not
// throw.
// ---------------------------------------------------------------------------
class CleanupGuard {
public:
    explicit CleanupGuard(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~CleanupGuard() {
        if (fn_) fn_();
    }

    CleanupGuard(const CleanupGuard&)            = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

private:
    std::function<void()> fn_;
};

} // namespace stream
