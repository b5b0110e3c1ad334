// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/context.h"

#include <utility>

namespace stream {

ContextPtr Context::background() {
    static const ContextPtr root =
        std::make_shared<const Context>(Private{}, nullptr);
    return root;
}

ContextPtr Context::with_cancel(ContextPtr parent) {
    return std::make_shared<const Context>(Private{}, std::move(parent));
}

ContextPtr Context::with_deadline(ContextPtr parent, TimePoint deadline) {
    auto ctx = std::make_shared<Context>(Private{}, std::move(parent));
    ctx->deadline_ = deadline;
    return ctx;
}

ContextPtr Context::with_timeout(ContextPtr parent, Clock::duration timeout) {
    return with_deadline(std::move(parent), Clock::now() + timeout);
}

ContextPtr Context::with_value(ContextPtr parent, std::string key,
                               std::string value) {
    auto ctx = std::make_shared<Context>(Private{}, std::move(parent));
    ctx->key_   = std::move(key);
    ctx->value_ = std::move(value);
    return ctx;
}

void Context::cancel() const noexcept {
    // The shared root is never cancelled.
    if (parent_ == nullptr) return;
    cancelled_.store(true, std::memory_order_release);
}

bool Context::is_done() const {
    return !err().is_ok();
}

core::Error Context::err() const {
    const auto now = Clock::now();
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (c->cancelled_.load(std::memory_order_acquire)) {
            return core::Error(core::ErrorCode::CONTEXT_CANCELLED,
                               "context cancelled");
        }
        if (c->deadline_ && now >= *c->deadline_) {
            return core::Error(core::ErrorCode::CONTEXT_DEADLINE,
                               "context deadline exceeded");
        }
    }
    return core::Error{};
}

std::optional<Context::TimePoint> Context::deadline() const {
    std::optional<TimePoint> earliest;
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (c->deadline_ && (!earliest || *c->deadline_ < *earliest)) {
            earliest = c->deadline_;
        }
    }
    return earliest;
}

std::optional<std::string> Context::value(std::string_view key) const {
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (c->key_ && *c->key_ == key) {
            return c->value_;
        }
    }
    return std::nullopt;
}

} // namespace stream
