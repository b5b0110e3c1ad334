#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "stream/datapack.h"

#include <cstddef>
#include <functional>
#include <vector>

namespace stream {

/// One step of a Producer.  A null @p pack means "no item this round".
struct Production {
    DatapackPtr pack;
    bool        has_more = true;
};

// ---------------------------------------------------------------------------
// Producer -- stateful source driven by a SafeProducerStage
// ---------------------------------------------------------------------------
// next() is called repeatedly from the stage's task until it returns an
// error or has_more == false.  It may throw; the stage reports the
// exception as a PRODUCER_FAULT.
// ---------------------------------------------------------------------------
class Producer {
public:
    virtual ~Producer() = default;

    [[nodiscard]] virtual core::Result<Production> next() = 0;
};

/// Adapts a callable to the Producer interface.
class FunctionProducer final : public Producer {
public:
    using Fn = std::function<core::Result<Production>()>;

    explicit FunctionProducer(Fn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] core::Result<Production> next() override { return fn_(); }

private:
    Fn fn_;
};

/// Yields a prepared list of packs in order (null entries included) and
/// reports has_more == false with the last one.  An empty list yields a
/// single null pack with has_more == false.
class VectorProducer final : public Producer {
public:
    explicit VectorProducer(std::vector<DatapackPtr> packs)
        : packs_(std::move(packs)) {}

    [[nodiscard]] core::Result<Production> next() override;

    /// Number of next() calls so far.
    [[nodiscard]] size_t calls() const noexcept { return calls_; }

private:
    std::vector<DatapackPtr> packs_;
    size_t                   pos_   = 0;
    size_t                   calls_ = 0;
};

} // namespace stream
