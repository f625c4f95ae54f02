#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array in network (big-endian) order
// ---------------------------------------------------------------------------
// Used for Keccak digests, transaction hashes, contract storage keys
// (N=32) and account addresses (N=20). Bytes are stored exactly as they
// appear on the wire and in hex, most-significant byte first.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    /// Default: zero-initialized.
    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse exactly 2*N hex characters, optionally "0x"-prefixed.
    static std::optional<Blob> from_hex(std::string_view hex);

    /// Lower-case hex, no prefix.
    [[nodiscard]] std::string to_hex() const;

    /// Lower-case hex with a "0x" prefix.
    [[nodiscard]] std::string to_hex_prefixed() const { return "0x" + to_hex(); }

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] std::span<const uint8_t, N> span() const noexcept {
        return std::span<const uint8_t, N>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept {
        return bytes_ <=> other.bytes_;
    }
    [[nodiscard]] bool operator==(const Blob& other) const noexcept = default;

protected:
    std::array<uint8_t, N> bytes_;
};

using Hash256 = Blob<32>;
using Bytes32 = Blob<32>;
using Bytes20 = Blob<20>;

extern template class Blob<20>;
extern template class Blob<32>;

}  // namespace core

template <std::size_t N>
struct std::hash<core::Blob<N>> {
    std::size_t operator()(const core::Blob<N>& v) const noexcept {
        std::size_t h = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < N; ++i) {
            h = (h << 8) | v.bytes()[N - 1 - i];
        }
        return h;
    }
};
