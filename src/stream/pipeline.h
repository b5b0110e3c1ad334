#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "stream/data_channel.h"
#include "stream/error_channel.h"
#include "stream/producer.h"
#include "stream/safe_producer.h"
#include "stream/safe_transform.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace stream {

// ---------------------------------------------------------------------------
// Pipeline -- one SafeProducerStage followed by a chain of transform stages
// ---------------------------------------------------------------------------
//   Pipeline p(std::make_unique<FileProducer>(paths));
//   p.then(digest_handler(print));
//   auto errors = drain(p.start());
//
// Stages are built and started in order by start().  Destroying a pipeline
// whose terminal stream was not fully consumed abandons it: the terminal
// Data Channel is closed, the terminal errors are discarded and every stage
// is joined.
// ---------------------------------------------------------------------------
class Pipeline {
public:
    /// @throws std::invalid_argument if @p producer is null or
    ///         @p error_capacity is zero.
    explicit Pipeline(std::unique_ptr<Producer> producer,
                      size_t error_capacity = DEFAULT_ERROR_CAPACITY,
                      std::chrono::milliseconds poll_interval =
                          DEFAULT_POLL_INTERVAL);

    ~Pipeline();

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// Append a transform stage.
    /// @throws std::logic_error once the pipeline has been started.
    Pipeline& then(Handler handler, Finalizer finalizer = {});

    /// Start every stage and return the terminal pair.
    /// @throws std::logic_error if called twice.
    StreamPair start();

    /// Join every stage, producer first.
    void join();

    /// Number of stages including the producer stage.
    [[nodiscard]] size_t size() const noexcept { return 1 + pending_.size(); }

    [[nodiscard]] bool started() const noexcept { return started_; }

    /// True if any stage reported a fault.
    [[nodiscard]] bool faulted() const noexcept;

private:
    struct PendingStage {
        Handler   handler;
        Finalizer finalizer;
    };

    SafeProducerStage                                source_;
    std::vector<PendingStage>                        pending_;
    std::vector<std::unique_ptr<SafeTransformStage>> transforms_;
    std::optional<StreamPair>                        terminal_;
    bool                                             started_ = false;
};

/// Consume a terminal pair: read every item (handing it to @p on_item when
/// one is given), then drain the Error Channel.  An empty result means the
/// stream completed cleanly and exhaustively.
[[nodiscard]] std::vector<core::Error> drain(
    const StreamPair& pair,
    const std::function<void(DatapackPtr)>& on_item = {});

/// Block until @p errors is closed and return what it held.
[[nodiscard]] std::vector<core::Error> collect_errors(ErrorChannel& errors);

} // namespace stream
