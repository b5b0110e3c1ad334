#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/thread.h"
#include "stream/byte_stream.h"
#include "stream/context.h"
#include "stream/data_channel.h"
#include "stream/stage.h"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace stream {

/// Consumes the body of one pack.  The handler may read the body, replace
/// it, or take it (leave it null).  A body still present afterwards is
/// forwarded downstream in the same pack.
using Handler = std::function<core::Result<void>(
    const ContextPtr& ctx, std::unique_ptr<ByteStream>& body)>;

/// Runs exactly once after a stage has closed its output pair.
using Finalizer = std::function<void()>;

// ---------------------------------------------------------------------------
// SafeTransformStage -- applies a Handler to every pack of an upstream pair
// ---------------------------------------------------------------------------
// Without a handler the stage is a pass-through: build_stream() returns
// the upstream pair itself and no task is started.  Otherwise start()
// launches one task that
//
//   1. reads upstream packs, skipping null packs and packs without a body,
//      and hands each body to the handler;  a handler error is put on the
//      output Error Channel and ends this phase;
//   2. closes the upstream Data Channel so a blocked upstream writer is
//      released;
//   3. relays every upstream error, in order, until the upstream Error
//      Channel is closed and drained.
//
// Exceptions in either phase become one HANDLER_FAULT error each.  On exit
// the output Error Channel is closed, then the output Data Channel, then
// the finalizer runs.  Destroying a started stage closes both Data
// Channels it touches before joining, so a reader that walked away cannot
// leave the task blocked.
// ---------------------------------------------------------------------------
class SafeTransformStage {
public:
    /// @param upstream   pair to read from; an invalid pair means "absent".
    /// @param handler    may be empty for a pass-through stage.
    /// @param finalizer  optional.
    SafeTransformStage(StreamPair upstream, Handler handler,
                       Finalizer finalizer = {});

    ~SafeTransformStage();

    SafeTransformStage(const SafeTransformStage&)            = delete;
    SafeTransformStage& operator=(const SafeTransformStage&) = delete;

    /// The pair downstream readers consume, created on first call.
    /// std::nullopt when there is no upstream.  The output Error Channel
    /// holds two more errors than the upstream one.
    [[nodiscard]] std::optional<StreamPair> build_stream();

    /// build_stream() plus launching the task when there is a handler.
    /// @throws std::logic_error if a handling stage is started twice.
    std::optional<StreamPair> start();

    void join();

    [[nodiscard]] bool pass_through() const noexcept { return !handler_; }
    [[nodiscard]] bool has_task() const noexcept { return task_.joinable(); }

    [[nodiscard]] StageState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool faulted() const noexcept { return faulted_.load(); }

    /// Packs given to the handler so far.
    [[nodiscard]] size_t handled() const noexcept { return handled_.load(); }

private:
    void run(StreamPair in, StreamPair out);
    void consume(StreamPair& in, StreamPair& out);
    void relay_errors(StreamPair& in, StreamPair& out);
    void report_fault(StreamPair& out, const std::string& what);
    void run_finalizer() noexcept;

    StreamPair              upstream_;
    std::optional<StreamPair> output_;
    Handler                 handler_;
    Finalizer               finalizer_;
    std::atomic<StageState> state_{StageState::NOT_STARTED};
    std::atomic<bool>       faulted_{false};
    std::atomic<bool>       finalized_{false};
    std::atomic<size_t>     handled_{0};

    core::TraceThread task_;
};

} // namespace stream
