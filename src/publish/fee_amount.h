#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace publish {

/// Fixed-point ETH amount with ten fractional digits, the precision the
/// fee ledger file carries. One unit is 1e-10 ETH (1e8 wei).
class FeeAmount {
    int64_t units_ = 0;

public:
    static constexpr int64_t UNITS_PER_ETH = 10'000'000'000;
    static constexpr uint64_t WEI_PER_UNIT = 100'000'000;
    static constexpr int FRACTION_DIGITS = 10;

    constexpr FeeAmount() = default;
    constexpr explicit FeeAmount(int64_t units) : units_(units) {}

    /// Convert wei to units, rounding half-up.
    static FeeAmount from_wei(uint64_t wei);

    /// Parse "[-]digits[.digits]". Digits beyond the tenth fractional
    /// place are rounded half-up. Returns nullopt for anything else,
    /// including exponents, "nan" and "inf".
    static std::optional<FeeAmount> parse(std::string_view text);

    [[nodiscard]] int64_t units() const { return units_; }
    [[nodiscard]] double to_eth() const;

    /// "%.10f" rendering, e.g. "0.0000383552".
    [[nodiscard]] std::string to_string() const;

    /// Checked addition.
    [[nodiscard]] core::Result<FeeAmount> operator+(FeeAmount other) const;

    bool operator==(FeeAmount o) const { return units_ == o.units_; }
    auto operator<=>(FeeAmount o) const { return units_ <=> o.units_; }
};

} // namespace publish
