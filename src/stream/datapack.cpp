// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/datapack.h"

namespace stream {

DatapackPtr make_datapack(std::unique_ptr<ByteStream> body, ContextPtr ctx) {
    if (!ctx) ctx = Context::background();
    return std::make_unique<Datapack>(std::move(body), std::move(ctx));
}

DatapackPtr make_datapack(std::vector<uint8_t> bytes, ContextPtr ctx) {
    return make_datapack(std::make_unique<BufferStream>(std::move(bytes)),
                         std::move(ctx));
}

DatapackPtr make_datapack(std::string_view text, ContextPtr ctx) {
    return make_datapack(std::make_unique<BufferStream>(text),
                         std::move(ctx));
}

} // namespace stream
