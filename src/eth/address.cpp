// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eth/address.h"

#include "core/hex.h"
#include "crypto/keccak.h"

#include <algorithm>
#include <cctype>

namespace eth {

core::Result<Address> Address::parse(std::string_view text) {
    std::string_view hex = core::strip_hex_prefix(text);
    if (hex.size() == text.size()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "address must start with 0x");
    }
    auto bytes = core::Bytes20::from_hex(hex);
    if (!bytes) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "address must be 40 hex digits: " +
                                std::string(text));
    }
    return Address(*bytes);
}

Address Address::from_pubkey(const std::array<uint8_t, 65>& pubkey) {
    core::Hash256 digest = crypto::keccak256(
        std::span<const uint8_t>(pubkey.data() + 1, 64));
    std::array<uint8_t, 20> tail{};
    std::copy(digest.data() + 12, digest.data() + 32, tail.begin());
    return Address(core::Bytes20::from_bytes(tail));
}

std::string Address::to_checksum_hex() const {
    const std::string lower = bytes_.to_hex();
    const core::Hash256 digest = crypto::keccak256(std::string_view(lower));

    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        uint8_t nibble = digest.data()[i / 2];
        nibble = (i % 2 == 0) ? (nibble >> 4) : (nibble & 0x0F);
        if (c >= 'a' && c <= 'f' && nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out += c;
    }
    return out;
}

bool Address::has_valid_checksum(std::string_view text) {
    auto parsed = parse(text);
    if (!parsed.ok()) return false;

    std::string_view hex = core::strip_hex_prefix(text);
    bool has_lower = false;
    bool has_upper = false;
    for (char c : hex) {
        if (c >= 'a' && c <= 'f') has_lower = true;
        if (c >= 'A' && c <= 'F') has_upper = true;
    }
    if (!has_lower || !has_upper) return true;
    return parsed.value().to_checksum_hex().substr(2) == hex;
}

} // namespace eth
