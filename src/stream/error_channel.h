#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/channel.h"
#include "core/error.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace stream {

/// Error Channel capacity used when none is configured.
inline constexpr size_t DEFAULT_ERROR_CAPACITY = 4;

/// Default upper bound on a single check() wait.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{10};

// ---------------------------------------------------------------------------
// ErrorChannel -- closable bounded FIFO of errors between one writer stage
// and one reader
// ---------------------------------------------------------------------------
// put() blocks while the buffer is full.  close() keeps unread errors, so
// the reader always sees every error that was put before the close.
// ---------------------------------------------------------------------------
class ErrorChannel {
public:
    /// Result of one check(): at most one of the two fields is set.
    struct Poll {
        std::optional<core::Error> error;
        bool                       done = false;
    };

    /// @throws std::invalid_argument if @p capacity is zero.
    explicit ErrorChannel(size_t capacity = DEFAULT_ERROR_CAPACITY,
                          std::chrono::milliseconds poll_interval =
                              DEFAULT_POLL_INTERVAL);

    ErrorChannel(const ErrorChannel&)            = delete;
    ErrorChannel& operator=(const ErrorChannel&) = delete;

    /// Append @p err, blocking while the channel is full.
    /// @returns false if the channel is closed (the error is dropped and a
    ///          warning logged).
    /// @throws std::invalid_argument if @p err is the null error.
    bool put(core::Error err);

    /// Next buffered error if one is queued; done once the channel is
    /// closed and drained; otherwise waits at most one poll interval and
    /// returns neither.
    [[nodiscard]] Poll check();

    /// Mark that no more errors will be appended.  Idempotent.
    void close();

    /// Block until the channel is closed, returning every remaining error
    /// in order.
    [[nodiscard]] std::vector<core::Error> drain();

    [[nodiscard]] size_t capacity() const noexcept { return queue_.capacity(); }
    [[nodiscard]] bool is_closed() const { return queue_.is_closed(); }

    /// Errors currently buffered.
    [[nodiscard]] size_t size() const { return queue_.size(); }

    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept {
        return poll_interval_;
    }

private:
    core::Channel<core::Error> queue_;
    std::chrono::milliseconds  poll_interval_;
};

} // namespace stream
