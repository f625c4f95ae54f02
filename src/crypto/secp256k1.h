#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "core/types.h"
#include "core/error.h"

typedef struct evp_pkey_st EVP_PKEY;

namespace crypto {

/// Compact ECDSA signature (r||s, low-S) plus the public key recovery id.
struct RecoverableSignature {
    std::array<uint8_t, 32> r{};
    std::array<uint8_t, 32> s{};
    int recovery_id = -1;   // 0 or 1 (y parity of R)

    [[nodiscard]] std::array<uint8_t, 64> compact() const;
};

/// ECDSA key pair on the secp256k1 curve using OpenSSL 3.0+ EVP API.
/// Owns a 32-byte secret and the corresponding EVP_PKEY.
class ECKey {
public:
    ECKey() = default;
    ~ECKey();

    ECKey(const ECKey&) = delete;
    ECKey& operator=(const ECKey&) = delete;

    ECKey(ECKey&& other) noexcept;
    ECKey& operator=(ECKey&& other) noexcept;

    /// Construct from an existing 32-byte secret scalar.
    /// Returns an error if the scalar is zero or >= curve order.
    static core::Result<ECKey> from_secret(std::span<const uint8_t, 32> secret);

    /// Parse a 64-digit hex secret, optionally "0x"-prefixed.
    static core::Result<ECKey> from_hex(std::string_view hex);

    /// True when this object holds a valid private key.
    bool is_valid() const { return pkey_ != nullptr; }

    /// SEC1 uncompressed public key (65 bytes: 0x04 || x || y).
    std::array<uint8_t, 65> pubkey_uncompressed() const;

    /// Sign a 32-byte digest. The signature is normalised to low-S and
    /// carries the recovery id that reproduces this key's public point.
    core::Result<RecoverableSignature> sign_recoverable(
        const core::Hash256& hash) const;

    /// Verify a 64-byte compact (r||s) ECDSA signature.
    static bool verify_compact(std::span<const uint8_t> pubkey,
                               const core::Hash256& hash,
                               std::span<const uint8_t, 64> sig);

    /// Recover the uncompressed public key from a compact signature and
    /// recovery id (0..3).
    static core::Result<std::array<uint8_t, 65>> recover_compact(
        const core::Hash256& hash,
        std::span<const uint8_t, 64> sig,
        int recovery_id);

private:
    std::array<uint8_t, 32> secret_{};
    EVP_PKEY* pkey_ = nullptr;
};

}  // namespace crypto
