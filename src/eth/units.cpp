#include "eth/units.h"

#include "core/hex.h"

#include <algorithm>
#include <array>

namespace eth {

publish::FeeAmount wei_to_fee(uint64_t wei) {
    return publish::FeeAmount::from_wei(wei);
}

std::string format_gwei(uint64_t wei) {
    std::string out = std::to_string(wei / WEI_PER_GWEI);
    uint64_t frac = wei % WEI_PER_GWEI;
    if (frac == 0) return out;

    std::string digits = std::to_string(frac);
    digits.insert(0, 9 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return out + "." + digits;
}

std::string to_quantity(uint64_t value) {
    return core::to_hex_quantity(value);
}

core::Result<uint64_t> parse_quantity(std::string_view text) {
    const std::string_view body = core::strip_hex_prefix(text);
    if (body.size() == text.size() || body.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "bad quantity: \"" + std::string(text) + "\"");
    }
    std::string_view digits = body;
    while (digits.size() > 1 && digits.front() == '0') digits.remove_prefix(1);
    if (digits.size() > 16) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                "quantity exceeds 64 bits: " + std::string(text));
    }

    uint64_t value = 0;
    for (char c : digits) {
        const int v = core::hex_digit_value(c);
        if (v < 0) {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                    "bad quantity: \"" + std::string(text) + "\"");
        }
        value = (value << 4) | static_cast<uint64_t>(v);
    }
    return value;
}

std::optional<core::Bytes32> parse_uint256(std::string_view text) {
    if (text.empty()) return std::nullopt;

    std::array<uint8_t, 32> be{};
    const std::string_view hex = core::strip_hex_prefix(text);
    if (hex.size() != text.size()) {
        if (hex.empty() || hex.size() > 64) return std::nullopt;
        std::string padded(64 - hex.size(), '0');
        padded.append(hex);
        auto word = core::Bytes32::from_hex(padded);
        return word;
    }

    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        // be = be * 10 + digit
        unsigned carry = static_cast<unsigned>(c - '0');
        for (int i = 31; i >= 0; --i) {
            unsigned v = be[static_cast<size_t>(i)] * 10u + carry;
            be[static_cast<size_t>(i)] = static_cast<uint8_t>(v & 0xFF);
            carry = v >> 8;
        }
        if (carry != 0) return std::nullopt;
    }
    return core::Bytes32::from_bytes(be);
}

core::Bytes32 uint256_from_u64(uint64_t value) {
    std::array<uint8_t, 32> be{};
    for (int i = 0; i < 8; ++i) {
        be[31 - static_cast<size_t>(i)] = static_cast<uint8_t>(value >> (8 * i));
    }
    return core::Bytes32::from_bytes(be);
}

std::string uint256_to_decimal(const core::Bytes32& value) {
    std::array<uint8_t, 32> work = value.bytes();
    std::string digits;
    bool nonzero = true;
    while (nonzero) {
        // work = work / 10, remainder is the next digit
        unsigned rem = 0;
        nonzero = false;
        for (auto& byte : work) {
            unsigned cur = (rem << 8) | byte;
            byte = static_cast<uint8_t>(cur / 10);
            rem = cur % 10;
            if (byte != 0) nonzero = true;
        }
        digits.push_back(static_cast<char>('0' + rem));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace eth
