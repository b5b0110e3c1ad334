#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"
#include "stream/context.h"
#include "stream/safe_transform.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace stream {

/// Chunk size used by the stock handlers when reading a body.
inline constexpr size_t HANDLER_CHUNK_SIZE = 64 * 1024;

using DigestCallback =
    std::function<void(const ContextPtr& ctx, const crypto::Sha256Digest&)>;

/// Handler that consumes each body, hashes it with SHA-256 and reports the
/// digest through @p on_digest.  A read error or a cancelled / expired
/// context ends the stage with that error.
[[nodiscard]] Handler digest_handler(DigestCallback on_digest);

/// Handler that consumes each body and appends its bytes to @p sink.  The
/// vector must outlive the stage.
[[nodiscard]] Handler collect_handler(std::vector<uint8_t>& sink);

} // namespace stream
