#pragma once
// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-256 wrapper around the OpenSSL 3.0+ EVP API.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

// Forward-declare the OpenSSL context type so callers do not need the
// OpenSSL headers just to include this header.
struct evp_md_ctx_st;       // EVP_MD_CTX
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

inline constexpr size_t SHA256_SIZE = 32;

/// Raw 32-byte SHA-256 digest.
using Sha256Digest = std::array<uint8_t, SHA256_SIZE>;

/// Lowercase hex rendering of a digest, as printed by sha256sum.
[[nodiscard]] std::string to_hex(const Sha256Digest& digest);

// ===================================================================
// One-shot hash functions
// ===================================================================

[[nodiscard]] Sha256Digest sha256(std::span<const uint8_t> data);
[[nodiscard]] Sha256Digest sha256(std::string_view text);

// ===================================================================
// Incremental hasher (streaming interface)
// ===================================================================

/// Move-only incremental SHA-256 hasher backed by an OpenSSL EVP_MD_CTX.
/// Feed data with write(), obtain the digest with finalize().  Call
/// reset() to reuse the object for another hash.
///
/// All methods throw std::runtime_error when OpenSSL reports a failure or
/// the hasher is used after finalize().
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    Sha256Hasher(Sha256Hasher&& other) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&& other) noexcept;

    Sha256Hasher& write(std::span<const uint8_t> data);

    [[nodiscard]] Sha256Digest finalize();

    void reset();

    /// Total bytes written since construction or the last reset().
    [[nodiscard]] uint64_t bytes_written() const noexcept { return written_; }

private:
    void init();

    EVP_MD_CTX* ctx_ = nullptr;
    bool finalized_ = false;
    uint64_t written_ = 0;
};

}  // namespace crypto
