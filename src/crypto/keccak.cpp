// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

namespace {

struct MdDeleter {
    void operator()(EVP_MD* md) const noexcept { EVP_MD_free(md); }
};

/// The fetched KECCAK-256 implementation, shared by every hasher.
const EVP_MD* keccak_md() {
    static const std::unique_ptr<EVP_MD, MdDeleter> md(
        EVP_MD_fetch(nullptr, "KECCAK-256", nullptr));
    if (!md) {
        throw std::runtime_error(
            "keccak256: EVP_MD_fetch(\"KECCAK-256\") failed");
    }
    return md.get();
}

}  // namespace

// ===================================================================
// Keccak256Hasher
// ===================================================================

Keccak256Hasher::Keccak256Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_MD_CTX_new() allocation failed");
    }
    try {
        reset();
    } catch (const std::runtime_error&) {
        EVP_MD_CTX_free(ctx_);
        throw;
    }
}

Keccak256Hasher::~Keccak256Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

Keccak256Hasher::Keccak256Hasher(Keccak256Hasher&& other) noexcept
    : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Keccak256Hasher& Keccak256Hasher::operator=(Keccak256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) EVP_MD_CTX_free(ctx_);
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Keccak256Hasher::reset() {
    if (!ctx_) {
        throw std::runtime_error("Keccak256Hasher::reset(): moved-from hasher");
    }
    if (EVP_DigestInit_ex(ctx_, keccak_md(), nullptr) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher: EVP_DigestInit_ex() failed");
    }
}

Keccak256Hasher& Keccak256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_) {
        throw std::runtime_error("Keccak256Hasher::write(): moved-from hasher");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error(
            "Keccak256Hasher::write(): EVP_DigestUpdate() failed");
    }
    return *this;
}

core::Hash256 Keccak256Hasher::finalize() {
    if (!ctx_) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): moved-from hasher");
    }
    uint8_t buf[32];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx_, buf, &digest_len) != 1 || digest_len != 32) {
        throw std::runtime_error(
            "Keccak256Hasher::finalize(): EVP_DigestFinal_ex() failed");
    }
    reset();
    return core::Hash256::from_bytes(std::span<const uint8_t, 32>(buf, 32));
}

// ===================================================================
// One-shot functions
// ===================================================================

core::Hash256 keccak256(std::span<const uint8_t> data) {
    Keccak256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

core::Hash256 keccak256(std::string_view text) {
    return keccak256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

}  // namespace crypto
