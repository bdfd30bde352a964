#include <shpkit/quantize.hpp>

#include <limits>

namespace shpkit {

std::uint8_t best_index(const rgb8& color, const palette& pal) noexcept {
    std::uint8_t best = 0;
    std::uint32_t best_distance = std::numeric_limits<std::uint32_t>::max();

    for (std::size_t i = 0; i < PALETTE_COLORS; ++i) {
        const std::uint32_t d = rgb_distance_squared(color, pal[i]);
        if (d < best_distance) {
            best_distance = d;
            best = static_cast<std::uint8_t>(i);
            if (d == 0) {
                break;
            }
        }
    }

    return best;
}

} // namespace shpkit
