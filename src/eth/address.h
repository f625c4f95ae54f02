#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace eth {

// ---------------------------------------------------------------------------
// Address -- 20-byte account identifier
// ---------------------------------------------------------------------------
class Address {
public:
    Address() = default;
    explicit Address(const core::Bytes20& bytes) : bytes_(bytes) {}

    /// Parse "0x" + 40 hex digits. Any letter case is accepted; the
    /// checksum of mixed-case input is not enforced.
    static core::Result<Address> parse(std::string_view text);

    /// Last 20 bytes of keccak256(x || y) of an uncompressed SEC1 key.
    static Address from_pubkey(const std::array<uint8_t, 65>& pubkey);

    [[nodiscard]] const core::Bytes20& bytes() const { return bytes_; }

    /// Lower-case "0x…" form.
    [[nodiscard]] std::string to_hex() const { return bytes_.to_hex_prefixed(); }

    /// EIP-55 mixed-case checksum form.
    [[nodiscard]] std::string to_checksum_hex() const;

    /// True if @p text is all-lower, all-upper or correctly checksummed.
    [[nodiscard]] static bool has_valid_checksum(std::string_view text);

    bool operator==(const Address& other) const = default;

private:
    core::Bytes20 bytes_;
};

} // namespace eth
