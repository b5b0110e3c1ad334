// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/safe_producer.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace stream {

SafeProducerStage::SafeProducerStage(std::unique_ptr<Producer> producer,
                                     size_t error_capacity,
                                     std::chrono::milliseconds poll_interval)
    : producer_(std::move(producer)),
      error_capacity_(error_capacity),
      poll_interval_(poll_interval) {
    if (!producer_) {
        throw std::invalid_argument("SafeProducerStage: null producer");
    }
    if (error_capacity_ == 0) {
        throw std::invalid_argument(
            "SafeProducerStage: error capacity must be at least 1");
    }
}

SafeProducerStage::~SafeProducerStage() {
    if (task_.joinable()) out_data_->close();
    join();
}

StreamPair SafeProducerStage::start() {
    StageState expected = StageState::NOT_STARTED;
    if (!state_.compare_exchange_strong(expected, StageState::RUNNING)) {
        throw std::logic_error("SafeProducerStage::start(): already started");
    }

    StreamPair out = make_stream_pair(error_capacity_, poll_interval_);
    out_data_ = out.data;
    task_ = core::TraceThread("sluice-produce", [this, out] { run(out); });
    return out;
}

void SafeProducerStage::join() {
    task_.join();
}

void SafeProducerStage::run(StreamPair out) {
    CleanupGuard cleanup([this, &out] {
        out.errors->close();
        out.data->close();
        state_.store(StageState::CLOSED);
        LOG_DEBUG(core::LogCategory::PRODUCER,
                  "producer stage closed after "
                      + std::to_string(delivered_.load()) + " pack(s)");
    });

    try {
        produce(out);
        state_.store(StageState::COMPLETED);
    } catch (...) {
        std::string what = describe_current_exception();
        faulted_.store(true);
        state_.store(StageState::FAULTED);
        LOG_ERROR(core::LogCategory::PRODUCER,
                  "producer stage faulted: " + what);
        out.errors->put(core::Error(core::ErrorCode::PRODUCER_FAULT,
                                    "SafeProducerStage faulted: " + what));
    }
}

void SafeProducerStage::produce(StreamPair& out) {
    for (;;) {
        auto step = producer_->next();
        if (!step.ok()) {
            LOG_DEBUG(core::LogCategory::PRODUCER,
                      "producer failed: " + step.error().format());
            out.errors->put(std::move(step).error());
            return;
        }

        Production prod = std::move(step).value();
        if (prod.pack) {
            if (out.data->write(std::move(prod.pack))) {
                LOG_DEBUG(core::LogCategory::PRODUCER,
                          "data channel closed by reader, stopping");
                return;
            }
            delivered_.fetch_add(1);
        }
        if (!prod.has_more) return;
    }
}

} // namespace stream
