// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "stream/byte_stream.h"
#include "core/logging.h"

#include <algorithm>
#include <cstring>
#include <system_error>

namespace stream {

core::Result<std::vector<uint8_t>> read_all(ByteStream& stream,
                                            size_t chunk_size) {
    std::vector<uint8_t> out;
    std::vector<uint8_t> chunk(std::max<size_t>(chunk_size, 1));
    for (;;) {
        auto n = stream.read(chunk);
        if (!n.ok()) return std::move(n).error();
        if (n.value() == 0) break;
        out.insert(out.end(), chunk.begin(),
                   chunk.begin() + static_cast<std::ptrdiff_t>(n.value()));
    }
    return out;
}

// ---------------------------------------------------------------------------
// BufferStream
// ---------------------------------------------------------------------------

core::Result<size_t> BufferStream::read(std::span<uint8_t> buf) {
    if (closed_) {
        return core::make_error(core::ErrorCode::STREAM_CLOSED,
                                "BufferStream::read(): stream is closed");
    }
    size_t n = std::min(buf.size(), remaining());
    if (n > 0) {
        std::memcpy(buf.data(), buf_.data() + read_pos_, n);
        read_pos_ += n;
    }
    return n;
}

void BufferStream::close() {
    closed_ = true;
}

// ---------------------------------------------------------------------------
// FileStream
// ---------------------------------------------------------------------------

core::Result<std::unique_ptr<FileStream>> FileStream::open(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return core::make_error(core::ErrorCode::IO_NOT_FOUND,
                                "no such file: '" + path.string() + "'");
    }
    if (std::filesystem::is_directory(path, ec)) {
        return core::make_error(core::ErrorCode::IO_ERROR,
                                "is a directory: '" + path.string() + "'");
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return core::make_error(core::ErrorCode::IO_ERROR,
                                "cannot open '" + path.string() + "'");
    }

    LOG_TRACE(core::LogCategory::IO, "opened '" + path.string() + "'");
    return std::unique_ptr<FileStream>(
        new FileStream(path, std::move(file)));
}

FileStream::~FileStream() {
    close();
}

core::Result<size_t> FileStream::read(std::span<uint8_t> buf) {
    if (closed_) {
        return core::make_error(core::ErrorCode::STREAM_CLOSED,
                                "FileStream::read(): stream is closed");
    }
    if (buf.empty() || file_.eof()) return size_t{0};

    file_.read(reinterpret_cast<char*>(buf.data()),
               static_cast<std::streamsize>(buf.size()));
    if (file_.bad()) {
        return core::make_error(core::ErrorCode::STREAM_IO,
                                "read failed on '" + path_.string() + "'");
    }
    return static_cast<size_t>(file_.gcount());
}

void FileStream::close() {
    if (closed_) return;
    closed_ = true;
    file_.close();
}

} // namespace stream
