#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/channel.h"
#include "stream/datapack.h"
#include "stream/error_channel.h"

#include <memory>

namespace stream {

/// Single-slot hand-off of Datapacks between one writer and one reader.
///   write(pack) -> true when the reader closed the channel (stop producing)
///   read()      -> std::nullopt once closed
///   close()     -> idempotent, callable from either side
using DataChannel = core::HandoffChannel<DatapackPtr>;

// ---------------------------------------------------------------------------
// StreamPair -- the (Data Channel, Error Channel) pair at a stage boundary
// ---------------------------------------------------------------------------
// The stage that creates a pair is its only writer; the pair is handed to
// exactly one reader (the next stage or the application).
// ---------------------------------------------------------------------------
struct StreamPair {
    std::shared_ptr<DataChannel>  data;
    std::shared_ptr<ErrorChannel> errors;

    [[nodiscard]] bool valid() const noexcept { return data && errors; }
};

/// A fresh open pair whose Error Channel holds @p error_capacity errors.
[[nodiscard]] inline StreamPair make_stream_pair(
    size_t error_capacity = DEFAULT_ERROR_CAPACITY,
    std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL) {
    return StreamPair{
        std::make_shared<DataChannel>(),
        std::make_shared<ErrorChannel>(error_capacity, poll_interval)};
}

} // namespace stream
