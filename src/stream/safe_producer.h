#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/thread.h"
#include "stream/data_channel.h"
#include "stream/error_channel.h"
#include "stream/producer.h"
#include "stream/stage.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace stream {

// ---------------------------------------------------------------------------
// SafeProducerStage -- drives a Producer on its own thread
// ---------------------------------------------------------------------------
// start() returns a fresh (Data Channel, Error Channel) pair and launches
// one task that:
//
//   * calls Producer::next() until it fails or reports has_more == false,
//   * puts a producer error on the Error Channel and stops,
//   * skips null packs without writing,
//   * writes every other pack, stopping as soon as the reader has closed
//     the Data Channel,
//   * turns any exception into a single PRODUCER_FAULT error.
//
// However the task ends, the Error Channel is closed first and the Data
// Channel second.  The destructor closes the Data Channel on behalf of a
// reader that walked away, then joins the task.
// ---------------------------------------------------------------------------
class SafeProducerStage {
public:
    /// @throws std::invalid_argument if @p producer is null or
    ///         @p error_capacity is zero.
    explicit SafeProducerStage(
        std::unique_ptr<Producer> producer,
        size_t error_capacity = DEFAULT_ERROR_CAPACITY,
        std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

    ~SafeProducerStage();

    SafeProducerStage(const SafeProducerStage&)            = delete;
    SafeProducerStage& operator=(const SafeProducerStage&) = delete;

    /// Launch the task and return the pair it writes to.
    /// @throws std::logic_error if the stage was already started.
    StreamPair start();

    /// Block until the task has finished its cleanup.
    void join();

    [[nodiscard]] StageState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool faulted() const noexcept { return faulted_.load(); }

    /// Packs accepted by the reader so far.
    [[nodiscard]] size_t delivered() const noexcept { return delivered_.load(); }

private:
    void run(StreamPair out);
    void produce(StreamPair& out);

    std::unique_ptr<Producer>  producer_;
    size_t                     error_capacity_;
    std::chrono::milliseconds  poll_interval_;
    std::atomic<StageState>    state_{StageState::NOT_STARTED};
    std::atomic<bool>          faulted_{false};
    std::atomic<size_t>        delivered_{0};
    std::shared_ptr<DataChannel> out_data_;

    // Declared last so it is joined before the members above go away.
    core::TraceThread task_;
};

} // namespace stream
