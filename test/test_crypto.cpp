// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for Keccak-256 and secp256k1 keys.

#include "test_framework.h"

#include "core/hex.h"
#include "core/types.h"
#include "crypto/keccak.h"
#include "crypto/secp256k1.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // anonymous namespace

// ============================================================================
// Keccak-256
// ============================================================================

TEST_CASE(Keccak, empty_input) {
    CHECK_EQ(crypto::keccak256(std::string_view{}).to_hex(),
             "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST_CASE(Keccak, abc) {
    CHECK_EQ(crypto::keccak256(std::string_view{"abc"}).to_hex(),
             "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST_CASE(Keccak, differs_from_sha3) {
    // SHA3-256("") starts with a7ffc6f8; Keccak padding must not match it.
    CHECK(crypto::keccak256(std::string_view{}).to_hex().rfind("a7ffc6f8", 0) ==
          std::string::npos);
}

TEST_CASE(Keccak, function_selector) {
    auto digest = crypto::keccak256(
        std::string_view{"transfer(address,uint256)"});
    CHECK_EQ(digest.to_hex().substr(0, 8), "a9059cbb");
}

TEST_CASE(Keccak, incremental_matches_one_shot_across_rate_boundary) {
    // 300 bytes spans more than two 136-byte blocks.
    std::string text;
    for (int i = 0; i < 300; ++i) text.push_back(static_cast<char>('a' + i % 26));
    auto data = bytes_of(text);

    crypto::Keccak256Hasher hasher;
    hasher.write(std::span<const uint8_t>(data.data(), 1));
    hasher.write(std::span<const uint8_t>(data.data() + 1, 135));
    hasher.write(std::span<const uint8_t>(data.data() + 136, 164));
    CHECK(hasher.finalize() == crypto::keccak256(data));

    // finalize() resets the hasher.
    CHECK(hasher.finalize() == crypto::keccak256(std::string_view{}));
}

TEST_CASE(Keccak, exact_rate_length) {
    std::vector<uint8_t> block(crypto::Keccak256Hasher::RATE, 0x61);
    crypto::Keccak256Hasher hasher;
    hasher.write(block);
    CHECK(hasher.finalize() == crypto::keccak256(block));
    CHECK(crypto::keccak256(block) !=
          crypto::keccak256(std::span<const uint8_t>(block.data(),
                                                     block.size() - 1)));
}

TEST_CASE(Keccak, moved_hasher_keeps_input) {
    auto data = bytes_of("abc");
    crypto::Keccak256Hasher first;
    first.write(std::span<const uint8_t>(data.data(), 1));
    crypto::Keccak256Hasher second(std::move(first));
    second.write(std::span<const uint8_t>(data.data() + 1, 2));
    CHECK(second.finalize() == crypto::keccak256(std::string_view{"abc"}));
}

// ============================================================================
// ECKey
// ============================================================================

TEST_CASE(ECKey, rejects_invalid_secrets) {
    std::array<uint8_t, 32> zero{};
    CHECK_ERR(crypto::ECKey::from_secret(zero));

    // The group order n itself is out of range.
    CHECK_ERR(crypto::ECKey::from_hex(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"));
    CHECK_ERR(crypto::ECKey::from_hex("0x1234"));
    CHECK_ERR(crypto::ECKey::from_hex(std::string(64, 'g')));
}

TEST_CASE(ECKey, public_key_of_one_is_generator) {
    auto key = crypto::ECKey::from_hex(std::string(63, '0') + "1");
    CHECK_OK(key);
    auto pub = key.value().pubkey_uncompressed();
    CHECK_EQ(pub[0], 0x04);
    CHECK_EQ(core::to_hex(std::span<const uint8_t>(pub.data() + 1, 32)),
             "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    CHECK_EQ(core::to_hex(std::span<const uint8_t>(pub.data() + 33, 32)),
             "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8");
}

TEST_CASE(ECKey, sign_verify_recover) {
    auto key = crypto::ECKey::from_hex(
        "0x4646464646464646464646464646464646464646464646464646464646464646");
    CHECK_OK(key);
    auto hash = crypto::keccak256(std::string_view{"board snapshot"});

    auto sig = key.value().sign_recoverable(hash);
    CHECK_OK(sig);
    const auto& rs = sig.value();
    CHECK(rs.recovery_id == 0 || rs.recovery_id == 1);

    // Low-S: the top bit of s is clear.
    CHECK((rs.s[0] & 0x80) == 0);

    auto compact = rs.compact();
    auto pub = key.value().pubkey_uncompressed();
    CHECK(crypto::ECKey::verify_compact(pub, hash, compact));

    auto recovered = crypto::ECKey::recover_compact(hash, compact, rs.recovery_id);
    CHECK_OK(recovered);
    CHECK(recovered.value() == pub);

    // The other recovery id yields a different point (or none).
    auto other = crypto::ECKey::recover_compact(hash, compact,
                                                rs.recovery_id ^ 1);
    CHECK(!other.ok() || other.value() != pub);
}

TEST_CASE(ECKey, verify_rejects_other_message) {
    auto key = crypto::ECKey::from_hex(std::string(62, '0') + "2a");
    CHECK_OK(key);
    auto sig = key.value().sign_recoverable(
        crypto::keccak256(std::string_view{"one"}));
    CHECK_OK(sig);
    CHECK(!crypto::ECKey::verify_compact(
        key.value().pubkey_uncompressed(),
        crypto::keccak256(std::string_view{"two"}),
        sig.value().compact()));
}

TEST_CASE(ECKey, move_transfers_ownership) {
    auto key = crypto::ECKey::from_hex(std::string(63, '0') + "7");
    CHECK_OK(key);
    crypto::ECKey moved = std::move(key).value();
    CHECK(moved.is_valid());
    crypto::ECKey empty;
    CHECK(!empty.is_valid());
}
