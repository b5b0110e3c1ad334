// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/error_channel.h"
#include "core/logging.h"

#include <stdexcept>
#include <utility>

namespace stream {

namespace {

size_t checked_capacity(size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument(
            "ErrorChannel: capacity must be at least 1");
    }
    return capacity;
}

} // anonymous namespace

ErrorChannel::ErrorChannel(size_t capacity,
                           std::chrono::milliseconds poll_interval)
    : queue_(checked_capacity(capacity))
    , poll_interval_(poll_interval.count() > 0 ? poll_interval
                                               : DEFAULT_POLL_INTERVAL) {}

bool ErrorChannel::put(core::Error err) {
    if (err.is_ok()) {
        throw std::invalid_argument("ErrorChannel::put(): null error");
    }
    std::string text = err.format();
    if (!queue_.send(std::move(err))) {
        LOG_WARN(core::LogCategory::CHANNEL,
                 "error dropped, channel closed: " + text);
        return false;
    }
    return true;
}

ErrorChannel::Poll ErrorChannel::check() {
    if (auto err = queue_.try_receive_for(poll_interval_)) {
        return Poll{std::move(err), false};
    }
    // Nothing arrived within the interval.  Distinguish "finished" from
    // "temporarily empty"; an error put in between is picked up next call.
    return Poll{std::nullopt, queue_.is_drained()};
}

void ErrorChannel::close() {
    queue_.close();
}

std::vector<core::Error> ErrorChannel::drain() {
    std::vector<core::Error> out;
    for (;;) {
        Poll p = check();
        if (p.done) break;
        if (p.error) out.push_back(std::move(*p.error));
    }
    return out;
}

} // namespace stream
