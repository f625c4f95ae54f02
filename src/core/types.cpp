#include "core/types.h"
#include "core/hex.h"

#include <algorithm>

namespace core {

// Definitions live here; explicit instantiations for the two sizes in use
// are at the bottom of this file.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::optional<Blob<N>> Blob<N>::from_hex(std::string_view hex) {
    hex = strip_hex_prefix(hex);
    if (hex.size() != N * 2) {
        return std::nullopt;
    }
    auto decoded = core::from_hex(hex);
    if (!decoded) {
        return std::nullopt;
    }
    Blob<N> result;
    std::copy(decoded->begin(), decoded->end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    return core::to_hex(std::span<const uint8_t>(bytes_.data(), N));
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template class Blob<20>;
template class Blob<32>;

}  // namespace core
