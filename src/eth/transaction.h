#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"
#include "crypto/secp256k1.h"
#include "eth/address.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace eth {

// ---------------------------------------------------------------------------
// LegacyTransaction -- pre-EIP-2718 transaction with EIP-155 replay
// protection
// ---------------------------------------------------------------------------
// Encoded as rlp([nonce, gasPrice, gas, to, value, data, v, r, s]) where
// v = chainId * 2 + 35 + recovery_id. The signing preimage replaces
// (v, r, s) by (chainId, 0, 0).
// ---------------------------------------------------------------------------
class LegacyTransaction {
public:
    uint64_t nonce     = 0;
    uint64_t gas_price = 0;
    uint64_t gas_limit = 0;
    Address  to;
    uint64_t value     = 0;
    std::vector<uint8_t> data;
    uint64_t chain_id  = 1;

    /// keccak256 of the EIP-155 signing preimage.
    [[nodiscard]] core::Hash256 signing_hash() const;

    /// Sign with @p key. Any previous signature is replaced.
    core::Result<void> sign(const crypto::ECKey& key);

    [[nodiscard]] bool is_signed() const { return signature_.has_value(); }

    /// EIP-155 v value. Only meaningful once signed.
    [[nodiscard]] uint64_t v() const;

    [[nodiscard]] const std::optional<crypto::RecoverableSignature>&
    signature() const { return signature_; }

    /// RLP encoding for eth_sendRawTransaction. An unsigned transaction
    /// encodes its signing preimage.
    [[nodiscard]] std::vector<uint8_t> raw() const;

    /// Transaction hash: keccak256(raw()).
    [[nodiscard]] core::Hash256 hash() const;

    /// Address of the signer, recovered from the signature.
    [[nodiscard]] core::Result<Address> recover_sender() const;

private:
    std::vector<std::vector<uint8_t>> encode_fields() const;
    std::vector<uint8_t> preimage() const;

    std::optional<crypto::RecoverableSignature> signature_;
};

} // namespace eth
