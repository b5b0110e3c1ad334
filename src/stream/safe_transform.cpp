// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/safe_transform.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace stream {

SafeTransformStage::SafeTransformStage(StreamPair upstream, Handler handler,
                                       Finalizer finalizer)
    : upstream_(std::move(upstream)),
      handler_(std::move(handler)),
      finalizer_(std::move(finalizer)) {}

SafeTransformStage::~SafeTransformStage() {
    if (task_.joinable()) {
        output_->data->close();
        upstream_.data->close();
    }
    join();
    // A stage that never ran a task (pass-through, or never started)
    // still owes its finalizer.
    run_finalizer();
}

std::optional<StreamPair> SafeTransformStage::build_stream() {
    if (!upstream_.valid()) return std::nullopt;
    if (!handler_) return upstream_;

    if (!output_) {
        output_ = make_stream_pair(upstream_.errors->capacity() + 2,
                                   upstream_.errors->poll_interval());
    }
    return output_;
}

std::optional<StreamPair> SafeTransformStage::start() {
    auto out = build_stream();
    if (!out) {
        LOG_WARN(core::LogCategory::HANDLER,
                 "transform stage has no upstream, nothing to start");
        return std::nullopt;
    }
    if (!handler_) return out;

    StageState expected = StageState::NOT_STARTED;
    if (!state_.compare_exchange_strong(expected, StageState::RUNNING)) {
        throw std::logic_error("SafeTransformStage::start(): already started");
    }

    task_ = core::TraceThread(
        "sluice-xform",
        [this, in = upstream_, dst = *out] { run(in, dst); });
    return out;
}

void SafeTransformStage::join() {
    task_.join();
}

void SafeTransformStage::run(StreamPair in, StreamPair out) {
    CleanupGuard cleanup([this, &out] {
        out.errors->close();
        out.data->close();
        run_finalizer();
        state_.store(StageState::CLOSED);
        LOG_DEBUG(core::LogCategory::HANDLER,
                  "transform stage closed after "
                      + std::to_string(handled_.load()) + " pack(s)");
    });

    try {
        consume(in, out);
    } catch (...) {
        std::string what = describe_current_exception();
        in.data->close();
        report_fault(out, what);
    }

    // Release an upstream writer that may be blocked on a pack nobody
    // will read any more.
    in.data->close();

    try {
        relay_errors(in, out);
    } catch (...) {
        report_fault(out, describe_current_exception());
    }

    if (!faulted_.load()) state_.store(StageState::COMPLETED);
}

void SafeTransformStage::consume(StreamPair& in, StreamPair& out) {
    for (;;) {
        auto item = in.data->read();
        if (!item) return;  // upstream closed

        DatapackPtr pack = std::move(*item);
        if (!pack || !pack->body()) {
            LOG_TRACE(core::LogCategory::HANDLER, "skipping empty pack");
            continue;
        }

        auto res = handler_(pack->context(), pack->body());
        handled_.fetch_add(1);
        if (!res.ok()) {
            LOG_DEBUG(core::LogCategory::HANDLER,
                      "handler failed: " + res.error().format());
            out.errors->put(std::move(res).error());
            return;
        }

        if (pack->body() && out.data->write(std::move(pack))) {
            LOG_DEBUG(core::LogCategory::HANDLER,
                      "output closed by reader, stopping");
            return;
        }
    }
}

void SafeTransformStage::relay_errors(StreamPair& in, StreamPair& out) {
    for (;;) {
        ErrorChannel::Poll poll = in.errors->check();
        if (poll.done) return;
        if (poll.error) out.errors->put(std::move(*poll.error));
    }
}

void SafeTransformStage::report_fault(StreamPair& out, const std::string& what) {
    faulted_.store(true);
    state_.store(StageState::FAULTED);
    LOG_ERROR(core::LogCategory::HANDLER, "transform stage faulted: " + what);
    out.errors->put(core::Error(core::ErrorCode::HANDLER_FAULT,
                                "SafeTransformStage faulted: " + what));
}

void SafeTransformStage::run_finalizer() noexcept {
    if (finalized_.exchange(true)) return;
    if (!finalizer_) return;
    try {
        finalizer_();
    } catch (const std::exception& e) {
        LOG_ERROR(core::LogCategory::HANDLER,
                  std::string("finalizer threw: ") + e.what());
    } catch (...) {
        LOG_ERROR(core::LogCategory::HANDLER,
                  "finalizer threw a non-standard exception");
    }
}

} // namespace stream
