#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Keccak-256 as used by Ethereum: the original Keccak submission with
// multi-rate padding 0x01..0x80, NOT NIST SHA3-256 (which pads with 0x06).
// Backed by OpenSSL's "KECCAK-256" digest (OpenSSL 3.2+ default provider).
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

// Forward declaration so callers need not include OpenSSL headers.
struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

/// Compute Keccak-256 of a byte span.
/// @throws std::runtime_error if the OpenSSL digest is unavailable.
[[nodiscard]] core::Hash256 keccak256(std::span<const uint8_t> data);

/// Compute Keccak-256 of the bytes of a string (no terminator).
[[nodiscard]] core::Hash256 keccak256(std::string_view text);

/// Incremental Keccak-256 over an EVP_MD_CTX. Feed data with write(),
/// obtain the digest with finalize(). finalize() resets the hasher for
/// reuse.
class Keccak256Hasher {
public:
    static constexpr size_t RATE = 136;  // sponge block size in bytes

    Keccak256Hasher();
    ~Keccak256Hasher();

    Keccak256Hasher(const Keccak256Hasher&) = delete;
    Keccak256Hasher& operator=(const Keccak256Hasher&) = delete;
    Keccak256Hasher(Keccak256Hasher&& other) noexcept;
    Keccak256Hasher& operator=(Keccak256Hasher&& other) noexcept;

    Keccak256Hasher& write(std::span<const uint8_t> data);

    [[nodiscard]] core::Hash256 finalize();

    /// Discard buffered input and start a fresh digest.
    void reset();

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

}  // namespace crypto
