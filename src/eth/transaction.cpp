// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eth/transaction.h"

#include "crypto/keccak.h"
#include "eth/rlp.h"

namespace eth {

std::vector<std::vector<uint8_t>> LegacyTransaction::encode_fields() const {
    std::vector<std::vector<uint8_t>> fields;
    fields.reserve(9);
    fields.push_back(rlp::encode_uint(nonce));
    fields.push_back(rlp::encode_uint(gas_price));
    fields.push_back(rlp::encode_uint(gas_limit));
    fields.push_back(rlp::encode_bytes(to.bytes().span()));
    fields.push_back(rlp::encode_uint(value));
    fields.push_back(rlp::encode_bytes(data));
    return fields;
}

std::vector<uint8_t> LegacyTransaction::preimage() const {
    auto fields = encode_fields();
    fields.push_back(rlp::encode_uint(chain_id));
    fields.push_back(rlp::encode_uint(0));
    fields.push_back(rlp::encode_uint(0));
    return rlp::encode_list(fields);
}

core::Hash256 LegacyTransaction::signing_hash() const {
    return crypto::keccak256(preimage());
}

core::Result<void> LegacyTransaction::sign(const crypto::ECKey& key) {
    CHAINBOARD_TRY_ASSIGN(sig, key.sign_recoverable(signing_hash()));
    signature_ = sig;
    return core::make_ok();
}

uint64_t LegacyTransaction::v() const {
    const uint64_t parity =
        signature_ ? static_cast<uint64_t>(signature_->recovery_id) : 0;
    return chain_id * 2 + 35 + parity;
}

std::vector<uint8_t> LegacyTransaction::raw() const {
    if (!signature_) return preimage();

    auto fields = encode_fields();
    fields.push_back(rlp::encode_uint(v()));
    fields.push_back(rlp::encode_uint_be(signature_->r));
    fields.push_back(rlp::encode_uint_be(signature_->s));
    return rlp::encode_list(fields);
}

core::Hash256 LegacyTransaction::hash() const {
    return crypto::keccak256(raw());
}

core::Result<Address> LegacyTransaction::recover_sender() const {
    if (!signature_) {
        return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                                "transaction is not signed");
    }
    const auto compact = signature_->compact();
    CHAINBOARD_TRY_ASSIGN(pubkey, crypto::ECKey::recover_compact(
        signing_hash(), compact, signature_->recovery_id));
    return Address::from_pubkey(pubkey);
}

} // namespace eth
