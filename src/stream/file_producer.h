#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/context.h"
#include "stream/producer.h"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace stream {

/// Context key under which FileProducer records the source path.
inline constexpr const char* PATH_KEY = "path";

/// Yields one Datapack per path, in order, whose body is a FileStream and
/// whose context carries PATH_KEY.  A path that cannot be opened ends
/// production with IO_NOT_FOUND or IO_ERROR.
class FileProducer final : public Producer {
public:
    explicit FileProducer(std::vector<std::filesystem::path> paths,
                          ContextPtr parent = nullptr);

    [[nodiscard]] core::Result<Production> next() override;

    [[nodiscard]] size_t opened() const noexcept { return pos_; }

private:
    std::vector<std::filesystem::path> paths_;
    ContextPtr                         parent_;
    size_t                             pos_ = 0;
};

} // namespace stream
