// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/handlers.h"

#include "core/logging.h"
#include "stream/byte_stream.h"

#include <memory>
#include <string>
#include <utility>

namespace stream {

Handler digest_handler(DigestCallback on_digest) {
    return [on_digest = std::move(on_digest)](
               const ContextPtr& ctx,
               std::unique_ptr<ByteStream>& body) -> core::Result<void> {
        std::unique_ptr<ByteStream> owned = std::move(body);

        crypto::Sha256Hasher hasher;
        std::vector<uint8_t> chunk(HANDLER_CHUNK_SIZE);
        for (;;) {
            if (core::Error cancelled = ctx->err()) {
                owned->close();
                return cancelled;
            }
            auto n = owned->read(chunk);
            if (!n.ok()) {
                owned->close();
                return std::move(n).error();
            }
            if (n.value() == 0) break;
            hasher.write(std::span<const uint8_t>(chunk.data(), n.value()));
        }
        owned->close();

        const crypto::Sha256Digest digest = hasher.finalize();
        LOG_TRACE(core::LogCategory::CRYPTO,
                  "sha256 " + crypto::to_hex(digest) + " over "
                      + std::to_string(hasher.bytes_written()) + " byte(s)");
        if (on_digest) on_digest(ctx, digest);
        return core::make_ok();
    };
}

Handler collect_handler(std::vector<uint8_t>& sink) {
    return [&sink](const ContextPtr&,
                   std::unique_ptr<ByteStream>& body) -> core::Result<void> {
        std::unique_ptr<ByteStream> owned = std::move(body);
        auto bytes = read_all(*owned, HANDLER_CHUNK_SIZE);
        owned->close();
        if (!bytes.ok()) return std::move(bytes).error();
        sink.insert(sink.end(), bytes.value().begin(), bytes.value().end());
        return core::make_ok();
    };
}

} // namespace stream
