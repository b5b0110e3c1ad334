#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace stream {

// ---------------------------------------------------------------------------
// ByteStream -- readable, closable source of bytes carried by a Datapack
// ---------------------------------------------------------------------------
// Reading a closed stream yields STREAM_CLOSED.  close() is idempotent and
// is also performed by the destructor of every concrete stream.
// ---------------------------------------------------------------------------
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Read up to buf.size() bytes into @p buf.
    /// @returns the number of bytes read; 0 means end of stream.
    [[nodiscard]] virtual core::Result<size_t> read(std::span<uint8_t> buf) = 0;

    /// Release the underlying resource.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_closed() const noexcept = 0;
};

/// Read @p stream to end of stream in chunks of @p chunk_size bytes.
[[nodiscard]] core::Result<std::vector<uint8_t>> read_all(
    ByteStream& stream, size_t chunk_size = 4096);

// ---------------------------------------------------------------------------
// BufferStream -- in-memory stream over an owned byte vector
// ---------------------------------------------------------------------------
class BufferStream final : public ByteStream {
public:
    BufferStream() = default;

    explicit BufferStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    explicit BufferStream(std::string_view text)
        : buf_(text.begin(), text.end()) {}

    [[nodiscard]] core::Result<size_t> read(std::span<uint8_t> buf) override;
    void close() override;
    [[nodiscard]] bool is_closed() const noexcept override { return closed_; }

    /// Total number of bytes in the underlying buffer.
    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    /// Number of bytes not read yet.
    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - read_pos_;
    }

private:
    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
    bool                 closed_   = false;
};

// ---------------------------------------------------------------------------
// FileStream -- stream over a file opened for binary reading
// ---------------------------------------------------------------------------
class FileStream final : public ByteStream {
public:
    /// @returns IO_NOT_FOUND if @p path does not exist, IO_ERROR if it
    ///          cannot be opened.
    [[nodiscard]] static core::Result<std::unique_ptr<FileStream>> open(
        const std::filesystem::path& path);

    ~FileStream() override;

    FileStream(const FileStream&)            = delete;
    FileStream& operator=(const FileStream&) = delete;

    [[nodiscard]] core::Result<size_t> read(std::span<uint8_t> buf) override;
    void close() override;
    [[nodiscard]] bool is_closed() const noexcept override { return closed_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

private:
    FileStream(std::filesystem::path path, std::ifstream file)
        : path_(std::move(path)), file_(std::move(file)) {}

    std::filesystem::path path_;
    std::ifstream         file_;
    bool                  closed_ = false;
};

} // namespace stream
