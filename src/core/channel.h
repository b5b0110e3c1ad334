#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace core {

// ---------------------------------------------------------------------------
// Channel<T> -- closable FIFO queue
// ---------------------------------------------------------------------------
// A mutex + condition-variable queue.  When capacity == 0 the channel is
// unbounded; when capacity > 0 `send()` blocks while the buffer is full.
//
// Closing is idempotent and never discards buffered items: receivers keep
// draining until the channel is both closed and empty.
// ---------------------------------------------------------------------------
template<typename T>
class Channel {
public:
    /// @param capacity  Maximum number of buffered items (0 = unbounded).
    explicit Channel(size_t capacity = 0)
        : capacity_(capacity) {}

    ~Channel() = default;

    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&)                 = delete;
    Channel& operator=(Channel&&)      = delete;

    // -- Send interface -----------------------------------------------------

    /// Enqueue an item.  Blocks while the channel is bounded and full.
    /// @return false (item dropped) if the channel is or becomes closed.
    bool send(T item) {
        std::unique_lock lock(mutex_);
        if (closed_) return false;
        if (capacity_ > 0) {
            not_full_.wait(lock, [this] {
                return closed_ || queue_.size() < capacity_;
            });
            if (closed_) return false;
        }
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // -- Receive interface --------------------------------------------------

    /// Dequeue, waiting at most @p timeout for an item.  Returns early
    /// with std::nullopt once the channel is closed and empty.
    template<typename Rep, typename Period>
    std::optional<T> try_receive_for(
        std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || closed_;
        });
        if (queue_.empty()) return std::nullopt;
        return pop_locked();
    }

    // -- Lifecycle -----------------------------------------------------------

    /// Signal that no more items will be sent.  Wakes all blocked waiters.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /// Closed and nothing left to receive.
    [[nodiscard]] bool is_drained() const {
        std::lock_guard lock(mutex_);
        return closed_ && queue_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    T pop_locked() {
        T item = std::move(queue_.front());
        queue_.pop_front();
        if (capacity_ > 0) {
            not_full_.notify_one();
        }
        return item;
    }

    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T>           queue_;
    const size_t            capacity_{0};
    bool                    closed_{false};
};

// ---------------------------------------------------------------------------
// HandoffChannel<T> -- single-slot rendezvous between one writer and one
// reader
// ---------------------------------------------------------------------------
// `write()` returns only once the reader has taken the item or the channel
// has been closed, so at most one item is ever in flight.  Either side may
// close: the reader closes to abandon the stream early, the writer closes
// to signal completion.  After close() every write reports "closed" and
// every read reports end of stream, even if an item was left in the slot.
// ---------------------------------------------------------------------------
template<typename T>
class HandoffChannel {
public:
    HandoffChannel() = default;
    ~HandoffChannel() = default;

    HandoffChannel(const HandoffChannel&)            = delete;
    HandoffChannel& operator=(const HandoffChannel&) = delete;
    HandoffChannel(HandoffChannel&&)                 = delete;
    HandoffChannel& operator=(HandoffChannel&&)      = delete;

    /// Hand @p item to the reader, blocking until it is taken.
    /// @return true if the channel was closed before the item was taken;
    ///         the item is then discarded and the writer must stop.
    bool write(T item) {
        std::unique_lock lock(mutex_);
        slot_free_.wait(lock, [this] {
            return closed_ || !slot_.has_value();
        });
        if (closed_) return true;

        slot_.emplace(std::move(item));
        const uint64_t ticket = ++offered_;
        slot_full_.notify_one();

        slot_free_.wait(lock, [this, ticket] {
            return closed_ || taken_ >= ticket;
        });
        if (taken_ >= ticket) return false;

        slot_.reset();
        return true;
    }

    /// Take the next item, blocking until one is offered.
    /// @return std::nullopt once the channel is closed.
    std::optional<T> read() {
        std::unique_lock lock(mutex_);
        slot_full_.wait(lock, [this] {
            return closed_ || slot_.has_value();
        });
        if (closed_) return std::nullopt;

        std::optional<T> item(std::move(slot_));
        slot_.reset();
        ++taken_;
        slot_free_.notify_all();
        return item;
    }

    /// Idempotent; wakes any blocked writer and reader.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        slot_full_.notify_all();
        slot_free_.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable slot_full_;
    std::condition_variable slot_free_;
    std::optional<T>        slot_;
    uint64_t                offered_{0};
    uint64_t                taken_{0};
    bool                    closed_{false};
};

}  // namespace core
