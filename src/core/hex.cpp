#include "core/hex.h"

namespace core {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

} // anonymous namespace

std::string to_hex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2, '\0');
    size_t i = 0;
    for (uint8_t byte : data) {
        out[i++] = DIGITS[byte >> 4];
        out[i++] = DIGITS[byte & 0x0F];
    }
    return out;
}

std::string to_hex_prefixed(std::span<const uint8_t> data) {
    return "0x" + to_hex(data);
}

std::string to_hex_quantity(uint64_t value) {
    char buf[16];
    size_t n = 0;
    do {
        buf[n++] = DIGITS[value & 0x0F];
        value >>= 4;
    } while (value != 0);

    std::string out = "0x";
    while (n > 0) out.push_back(buf[--n]);
    return out;
}

bool has_hex_prefix(std::string_view text) {
    return text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

std::string_view strip_hex_prefix(std::string_view text) {
    if (has_hex_prefix(text)) text.remove_prefix(2);
    return text;
}

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view text) {
    text = strip_hex_prefix(text);
    if (text.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        const int hi = hex_digit_value(text[i]);
        const int lo = hex_digit_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool is_hex(std::string_view text) {
    if (text.size() % 2 != 0) return false;
    for (char c : text) {
        if (hex_digit_value(c) < 0) return false;
    }
    return true;
}

} // namespace core
