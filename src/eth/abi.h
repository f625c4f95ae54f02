#pragma once

#include "core/types.h"

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace eth::abi {

inline constexpr std::string_view STORE_STRING_SIGNATURE =
    "storeString(uint256,bytes32,string)";

/// First four bytes of keccak256(signature).
std::array<uint8_t, 4> selector(std::string_view signature);

/// Calldata for storeString(uint256 tokenId, bytes32 key, string data):
/// selector, two static words, the offset of the dynamic string (0x60),
/// its byte length and the UTF-8 bytes zero-padded to a word boundary.
std::vector<uint8_t> encode_store_string(const core::Bytes32& token_id,
                                         const core::Bytes32& key,
                                         std::string_view data);

} // namespace eth::abi
