// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/producer.h"

namespace stream {

core::Result<Production> VectorProducer::next() {
    ++calls_;
    if (pos_ >= packs_.size()) {
        return Production{nullptr, false};
    }
    Production out;
    out.pack     = std::move(packs_[pos_]);
    out.has_more = ++pos_ < packs_.size();
    return std::move(out);
}

} // namespace stream
