#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/byte_stream.h"
#include "stream/context.h"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace stream {

// ---------------------------------------------------------------------------
// Datapack -- the unit handed from stage to stage
// ---------------------------------------------------------------------------
// A body (readable, closable byte stream) plus the context it travels with.
// The body may be absent; stages skip such packs.  A Datapack travels as a
// DatapackPtr, and a null DatapackPtr is the "no item this round" value a
// producer may yield.
// ---------------------------------------------------------------------------
class Datapack {
public:
    Datapack(std::unique_ptr<ByteStream> body, ContextPtr ctx)
        : body_(std::move(body)), ctx_(std::move(ctx)) {}

    Datapack(const Datapack&)            = delete;
    Datapack& operator=(const Datapack&) = delete;

    /// The body slot.  Handlers may take the stream out or replace it.
    [[nodiscard]] std::unique_ptr<ByteStream>& body() noexcept { return body_; }
    [[nodiscard]] const ByteStream* body() const noexcept { return body_.get(); }

    /// Never null: a pack built without a context carries background().
    [[nodiscard]] const ContextPtr& context() const noexcept { return ctx_; }

private:
    std::unique_ptr<ByteStream> body_;
    ContextPtr                  ctx_;
};

using DatapackPtr = std::unique_ptr<Datapack>;

/// Pack @p body with @p ctx (background() when null).
[[nodiscard]] DatapackPtr make_datapack(std::unique_ptr<ByteStream> body,
                                        ContextPtr ctx = nullptr);

/// Pack an in-memory copy of @p bytes.
[[nodiscard]] DatapackPtr make_datapack(std::vector<uint8_t> bytes,
                                        ContextPtr ctx = nullptr);

/// Pack an in-memory copy of @p text.
[[nodiscard]] DatapackPtr make_datapack(std::string_view text,
                                        ContextPtr ctx = nullptr);

} // namespace stream
