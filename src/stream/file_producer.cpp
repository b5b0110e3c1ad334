// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/file_producer.h"

#include "core/logging.h"
#include "stream/byte_stream.h"

#include <utility>

namespace stream {

FileProducer::FileProducer(std::vector<std::filesystem::path> paths,
                           ContextPtr parent)
    : paths_(std::move(paths)),
      parent_(parent ? std::move(parent) : Context::background()) {}

core::Result<Production> FileProducer::next() {
    if (pos_ >= paths_.size()) {
        return Production{nullptr, false};
    }

    const auto& path = paths_[pos_];
    SLUICE_TRY_ASSIGN(file, FileStream::open(path));
    ++pos_;

    LOG_DEBUG(core::LogCategory::IO, "opened " + path.string());
    auto ctx = Context::with_value(parent_, PATH_KEY, path.string());

    Production out;
    out.pack     = make_datapack(std::move(file), std::move(ctx));
    out.has_more = pos_ < paths_.size();
    return std::move(out);
}

} // namespace stream
