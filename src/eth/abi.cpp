#include "eth/abi.h"

#include "crypto/keccak.h"

#include <algorithm>

namespace eth::abi {

namespace {

constexpr size_t WORD = 32;

void append_word(std::vector<uint8_t>& out, uint64_t value) {
    const size_t start = out.size();
    out.resize(start + WORD, 0);
    for (size_t i = 0; i < 8; ++i) {
        out[start + WORD - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

} // anonymous namespace

std::array<uint8_t, 4> selector(std::string_view signature) {
    core::Hash256 digest = crypto::keccak256(signature);
    std::array<uint8_t, 4> sel{};
    std::copy_n(digest.data(), 4, sel.begin());
    return sel;
}

std::vector<uint8_t> encode_store_string(const core::Bytes32& token_id,
                                         const core::Bytes32& key,
                                         std::string_view data) {
    const size_t padded = (data.size() + WORD - 1) / WORD * WORD;

    std::vector<uint8_t> out;
    out.reserve(4 + 4 * WORD + padded);

    auto sel = selector(STORE_STRING_SIGNATURE);
    out.insert(out.end(), sel.begin(), sel.end());
    out.insert(out.end(), token_id.bytes().begin(), token_id.bytes().end());
    out.insert(out.end(), key.bytes().begin(), key.bytes().end());
    append_word(out, 3 * WORD);   // head is three words long
    append_word(out, data.size());

    out.insert(out.end(), data.begin(), data.end());
    out.resize(out.size() + (padded - data.size()), 0);
    return out;
}

} // namespace eth::abi
