#pragma once

#include "core/error.h"
#include "core/types.h"
#include "publish/fee_amount.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace eth {

inline constexpr uint64_t WEI_PER_GWEI = 1'000'000'000;

/// Fee of @p wei expressed in ledger units, rounded half-up.
publish::FeeAmount wei_to_fee(uint64_t wei);

/// Exact decimal gwei rendering without trailing zeros, e.g. 1300000 wei
/// -> "0.0013".
std::string format_gwei(uint64_t wei);

// -- JSON-RPC quantities ------------------------------------------------

/// "0x"-prefixed hex without leading zeros ("0x0" for zero).
std::string to_quantity(uint64_t value);

/// Parse a "0x"-prefixed quantity that fits in 64 bits.
core::Result<uint64_t> parse_quantity(std::string_view text);

// -- 256-bit integers ---------------------------------------------------

/// Parse a decimal or "0x"-hex unsigned integer into a big-endian 32-byte
/// word. Returns nullopt on bad digits or values wider than 256 bits.
std::optional<core::Bytes32> parse_uint256(std::string_view text);

core::Bytes32 uint256_from_u64(uint64_t value);

/// Decimal rendering of a big-endian 32-byte word.
std::string uint256_to_decimal(const core::Bytes32& value);

} // namespace eth
