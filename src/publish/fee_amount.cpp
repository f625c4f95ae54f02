// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "publish/fee_amount.h"

#include <algorithm>
#include <cstdio>
#include <limits>

namespace publish {

FeeAmount FeeAmount::from_wei(uint64_t wei) {
    const uint64_t units = wei / WEI_PER_UNIT +
                           ((wei % WEI_PER_UNIT) >= WEI_PER_UNIT / 2 ? 1 : 0);
    return FeeAmount(static_cast<int64_t>(units));
}

std::optional<FeeAmount> FeeAmount::parse(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' ||
                             text.back() == '\r')) {
        text.remove_suffix(1);
    }

    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) return std::nullopt;

    constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
    int64_t whole = 0;
    int64_t frac = 0;
    int frac_digits = 0;
    bool round_up = false;
    bool seen_dot = false;
    bool seen_digit = false;

    for (char c : text) {
        if (c == '.') {
            if (seen_dot) return std::nullopt;
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') return std::nullopt;
        seen_digit = true;
        const int d = c - '0';
        if (!seen_dot) {
            if (whole > (MAX / UNITS_PER_ETH - d) / 10) return std::nullopt;
            whole = whole * 10 + d;
        } else if (frac_digits < FRACTION_DIGITS) {
            frac = frac * 10 + d;
            ++frac_digits;
        } else if (frac_digits == FRACTION_DIGITS) {
            round_up = d >= 5;
            ++frac_digits;
        }
    }
    if (!seen_digit) return std::nullopt;

    for (int i = std::min(frac_digits, FRACTION_DIGITS); i < FRACTION_DIGITS; ++i) {
        frac *= 10;
    }
    const int64_t whole_units = whole * UNITS_PER_ETH;
    const int64_t frac_units = frac + (round_up ? 1 : 0);
    if (frac_units > MAX - whole_units) return std::nullopt;
    const int64_t units = whole_units + frac_units;
    return FeeAmount(negative ? -units : units);
}

double FeeAmount::to_eth() const {
    return static_cast<double>(units_) / static_cast<double>(UNITS_PER_ETH);
}

std::string FeeAmount::to_string() const {
    const bool negative = units_ < 0;
    // Magnitude as unsigned so INT64_MIN does not overflow.
    const uint64_t mag = negative ? 0 - static_cast<uint64_t>(units_)
                                  : static_cast<uint64_t>(units_);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s%llu.%010llu",
                  negative ? "-" : "",
                  static_cast<unsigned long long>(mag / UNITS_PER_ETH),
                  static_cast<unsigned long long>(mag % UNITS_PER_ETH));
    return buf;
}

core::Result<FeeAmount> FeeAmount::operator+(FeeAmount other) const {
    constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
    constexpr int64_t MIN = std::numeric_limits<int64_t>::min();
    if ((other.units_ > 0 && units_ > MAX - other.units_) ||
        (other.units_ < 0 && units_ < MIN - other.units_)) {
        return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                "fee amount addition overflows");
    }
    return FeeAmount(units_ + other.units_);
}

} // namespace publish
