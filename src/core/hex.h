#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

/// Lowercase, no prefix.
std::string to_hex(std::span<const uint8_t> data);

/// Lowercase with "0x", the form JSON-RPC expects for DATA values.
std::string to_hex_prefixed(std::span<const uint8_t> data);

/// Minimal "0x"-prefixed hex of an integer ("0x0", "0x1b4").
std::string to_hex_quantity(uint64_t value);

[[nodiscard]] bool has_hex_prefix(std::string_view text);

/// Drop a leading "0x" or "0X" if present.
std::string_view strip_hex_prefix(std::string_view text);

/// Value of one hex digit, or -1.
int hex_digit_value(char c);

/// Decode with or without "0x". nullopt on odd length or a non-hex digit.
std::optional<std::vector<uint8_t>> from_hex(std::string_view text);

/// Even-length run of hex digits, no prefix.
bool is_hex(std::string_view text);

} // namespace core
