#ifndef SHPKIT_QUANTIZE_HPP_
#define SHPKIT_QUANTIZE_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/palette.hpp>
#include <shpkit/types.hpp>

#include <cstdint>

namespace shpkit {

// Squared Euclidean RGB distance, no perceptual weighting
[[nodiscard]] constexpr std::uint32_t rgb_distance_squared(const rgb8& a, const rgb8& b) noexcept {
    const int dr = static_cast<int>(a.r) - static_cast<int>(b.r);
    const int dg = static_cast<int>(a.g) - static_cast<int>(b.g);
    const int db = static_cast<int>(a.b) - static_cast<int>(b.b);
    return static_cast<std::uint32_t>(dr * dr + dg * dg + db * db);
}

/**
 * Nearest palette index for a true-color pixel.
 * Ties resolve to the lowest index; an exact match ends the scan.
 */
[[nodiscard]] SHPKIT_EXPORT std::uint8_t best_index(const rgb8& color, const palette& pal) noexcept;

} // namespace shpkit

#endif // SHPKIT_QUANTIZE_HPP_
