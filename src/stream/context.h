#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Context -- cancellation and metadata carried alongside every Datapack.
//
// Contexts form a tree: a derived context sees its ancestors' cancellation,
// deadlines and values.  Stages never cancel or interpret a context; they
// only hand it to the handler together with the Datapack body.  Handlers
// and producers use it to impose timeouts or attach per-item metadata.
// ---------------------------------------------------------------------------

#include "core/error.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stream {

class Context;
using ContextPtr = std::shared_ptr<const Context>;

class Context {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /// The root context: never cancelled, no deadline, no values.
    static ContextPtr background();

    /// A child of @p parent that can be cancelled with cancel().
    static ContextPtr with_cancel(ContextPtr parent);

    /// A child of @p parent that expires at @p deadline.  An earlier
    /// ancestor deadline still applies.
    static ContextPtr with_deadline(ContextPtr parent, TimePoint deadline);

    static ContextPtr with_timeout(ContextPtr parent, Clock::duration timeout);

    /// A child of @p parent carrying @p key = @p value.
    static ContextPtr with_value(ContextPtr parent, std::string key,
                                 std::string value);

    /// Cancel this context and every context derived from it.  Idempotent;
    /// a no-op on background().
    void cancel() const noexcept;

    /// True once this context or an ancestor is cancelled or past its
    /// deadline.
    [[nodiscard]] bool is_done() const;

    /// NONE while live; CONTEXT_CANCELLED or CONTEXT_DEADLINE once done.
    [[nodiscard]] core::Error err() const;

    /// The earliest deadline along the ancestor chain, if any.
    [[nodiscard]] std::optional<TimePoint> deadline() const;

    /// Look up @p key, nearest context first.
    [[nodiscard]] std::optional<std::string> value(std::string_view key) const;

    Context(const Context&)            = delete;
    Context& operator=(const Context&) = delete;

private:
    struct Private {};

public:
    // Constructible only through the factory functions above.
    Context(Private, ContextPtr parent) : parent_(std::move(parent)) {}

private:
    ContextPtr                 parent_;
    std::optional<TimePoint>   deadline_;
    std::optional<std::string> key_;
    std::string                value_;
    mutable std::atomic<bool>  cancelled_{false};
};

} // namespace stream
