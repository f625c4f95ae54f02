// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eth/rlp.h"

namespace eth::rlp {

namespace {

constexpr uint8_t STRING_OFFSET = 0x80;
constexpr uint8_t LIST_OFFSET   = 0xC0;
constexpr size_t  SHORT_LIMIT   = 55;

// Short form: one byte offset+len. Long form: offset+55+len(len), then
// the big-endian length.
void write_header(Bytes& out, uint8_t offset, size_t length) {
    if (length <= SHORT_LIMIT) {
        out.push_back(static_cast<uint8_t>(offset + length));
        return;
    }
    uint8_t len_bytes[8];
    int n = 0;
    for (size_t v = length; v != 0; v >>= 8) {
        len_bytes[n++] = static_cast<uint8_t>(v & 0xFF);
    }
    out.push_back(static_cast<uint8_t>(offset + SHORT_LIMIT + n));
    while (n > 0) out.push_back(len_bytes[--n]);
}

} // anonymous namespace

Bytes encode_bytes(std::span<const uint8_t> data) {
    Bytes out;
    if (data.size() == 1 && data[0] < STRING_OFFSET) {
        out.push_back(data[0]);
        return out;
    }
    out.reserve(data.size() + 9);
    write_header(out, STRING_OFFSET, data.size());
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes encode_string(std::string_view text) {
    return encode_bytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

Bytes encode_uint(uint64_t value) {
    uint8_t be[8];
    for (int i = 7; i >= 0; --i) {
        be[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return encode_uint_be(be);
}

Bytes encode_uint_be(std::span<const uint8_t> big_endian) {
    size_t skip = 0;
    while (skip < big_endian.size() && big_endian[skip] == 0) ++skip;
    return encode_bytes(big_endian.subspan(skip));
}

Bytes encode_list(const std::vector<Bytes>& encoded_items) {
    size_t payload = 0;
    for (const auto& item : encoded_items) payload += item.size();

    Bytes out;
    out.reserve(payload + 9);
    write_header(out, LIST_OFFSET, payload);
    for (const auto& item : encoded_items) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

} // namespace eth::rlp
