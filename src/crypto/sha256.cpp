// Copyright (c) 2024-2026 The Sluice Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

std::string to_hex(const Sha256Digest& digest) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t byte : digest) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

Sha256Digest sha256(std::span<const uint8_t> data) {
    Sha256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

Sha256Digest sha256(std::string_view text) {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

// ===================================================================
// Sha256Hasher
// ===================================================================

void Sha256Hasher::init() {
    if (!ctx_) {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) {
            throw std::runtime_error(
                "Sha256Hasher: EVP_MD_CTX_new() allocation failed");
        }
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("Sha256Hasher: EVP_DigestInit_ex() failed");
    }
    finalized_ = false;
    written_ = 0;
}

Sha256Hasher::Sha256Hasher() {
    init();
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept
    : ctx_(other.ctx_), finalized_(other.finalized_),
      written_(other.written_) {
    other.ctx_ = nullptr;
    other.finalized_ = true;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        ctx_ = other.ctx_;
        finalized_ = other.finalized_;
        written_ = other.written_;
        other.ctx_ = nullptr;
        other.finalized_ = true;
    }
    return *this;
}

Sha256Hasher& Sha256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty()) {
        if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
            throw std::runtime_error(
                "Sha256Hasher::write(): EVP_DigestUpdate() failed");
        }
        written_ += data.size();
    }
    return *this;
}

Sha256Digest Sha256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): context not initialised "
            "or already finalised");
    }

    Sha256Digest out{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &digest_len) != 1
        || digest_len != SHA256_SIZE) {
        throw std::runtime_error(
            "Sha256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    finalized_ = true;
    return out;
}

void Sha256Hasher::reset() {
    init();
}

}  // namespace crypto
