// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/pipeline.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace stream {

Pipeline::Pipeline(std::unique_ptr<Producer> producer, size_t error_capacity,
                   std::chrono::milliseconds poll_interval)
    : source_(std::move(producer), error_capacity, poll_interval) {}

Pipeline::~Pipeline() {
    if (terminal_) {
        terminal_->data->close();
        auto leftover = terminal_->errors->drain();
        if (!leftover.empty()) {
            LOG_DEBUG(core::LogCategory::PIPELINE,
                      "discarding " + std::to_string(leftover.size())
                          + " unread error(s) of an abandoned pipeline");
        }
    }
    join();
}

Pipeline& Pipeline::then(Handler handler, Finalizer finalizer) {
    if (started_) {
        throw std::logic_error("Pipeline::then(): pipeline already started");
    }
    pending_.push_back(PendingStage{std::move(handler), std::move(finalizer)});
    return *this;
}

StreamPair Pipeline::start() {
    if (started_) {
        throw std::logic_error("Pipeline::start(): already started");
    }
    started_ = true;

    StreamPair pair = source_.start();
    for (auto& stage : pending_) {
        transforms_.push_back(std::make_unique<SafeTransformStage>(
            pair, std::move(stage.handler), std::move(stage.finalizer)));
        // A transform with an upstream always yields a pair.
        pair = *transforms_.back()->start();
    }
    terminal_ = pair;

    LOG_DEBUG(core::LogCategory::PIPELINE,
              "pipeline started with " + std::to_string(size()) + " stage(s)");
    return pair;
}

void Pipeline::join() {
    source_.join();
    for (auto& stage : transforms_) stage->join();
}

bool Pipeline::faulted() const noexcept {
    if (source_.faulted()) return true;
    for (const auto& stage : transforms_) {
        if (stage->faulted()) return true;
    }
    return false;
}

std::vector<core::Error> drain(const StreamPair& pair,
                               const std::function<void(DatapackPtr)>& on_item) {
    if (!pair.valid()) {
        throw std::invalid_argument("drain(): invalid stream pair");
    }
    size_t items = 0;
    while (auto pack = pair.data->read()) {
        ++items;
        if (on_item) on_item(std::move(*pack));
    }
    auto errors = pair.errors->drain();
    LOG_DEBUG(core::LogCategory::PIPELINE,
              "drained " + std::to_string(items) + " item(s) and "
                  + std::to_string(errors.size()) + " error(s)");
    return errors;
}

std::vector<core::Error> collect_errors(ErrorChannel& errors) {
    return errors.drain();
}

} // namespace stream
