#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace eth::rlp {

// ---------------------------------------------------------------------------
// Recursive Length Prefix encoding
// ---------------------------------------------------------------------------
// Items are encoded bottom-up: callers encode each field, then wrap the
// encoded fields with encode_list(). Integers are encoded as their
// minimal big-endian byte string (zero is the empty string).
// ---------------------------------------------------------------------------

using Bytes = std::vector<uint8_t>;

Bytes encode_bytes(std::span<const uint8_t> data);

Bytes encode_string(std::string_view text);

Bytes encode_uint(uint64_t value);

/// Encode a big-endian unsigned integer of any width (leading zero bytes
/// are stripped first).
Bytes encode_uint_be(std::span<const uint8_t> big_endian);

/// Wrap already-encoded items in a list header.
Bytes encode_list(const std::vector<Bytes>& encoded_items);

} // namespace eth::rlp
