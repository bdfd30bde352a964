#ifndef SHPKIT_PALETTE_HPP_
#define SHPKIT_PALETTE_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace shpkit {

// ============================================================================
// 256-color Palette
// ============================================================================
//
// On disk a palette is exactly 768 bytes: 256 RGB triplets, no header.
// Entries are stored at full 8-bit precision.

constexpr std::size_t PALETTE_COLORS = 256;
constexpr std::size_t PALETTE_FILE_SIZE = PALETTE_COLORS * 3;

class SHPKIT_EXPORT palette {
public:
    palette() = default;
    explicit palette(const std::array<rgb8, PALETTE_COLORS>& colors) noexcept
        : colors_(colors) {}

    /**
     * Grayscale ramp, entry i = (i, i, i).
     * Used as the fallback when no palette file has been chosen.
     */
    [[nodiscard]] static palette grayscale() noexcept;

    /**
     * Parse a 768-byte palette. Bytes past the first 768 are ignored.
     * @param data Raw palette bytes
     * @param out Destination, untouched on failure
     * @return invalid_palette if fewer than 768 bytes are supplied
     */
    [[nodiscard]] static codec_result parse(std::span<const std::uint8_t> data, palette& out);

    /**
     * Serialize to the 768-byte on-disk layout.
     */
    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    [[nodiscard]] const rgb8& operator[](std::size_t index) const noexcept { return colors_[index]; }
    [[nodiscard]] rgb8& operator[](std::size_t index) noexcept { return colors_[index]; }

    [[nodiscard]] const std::array<rgb8, PALETTE_COLORS>& colors() const noexcept { return colors_; }

    friend bool operator==(const palette&, const palette&) = default;

private:
    std::array<rgb8, PALETTE_COLORS> colors_{};
};

// ----------------------------------------------------------------------------
// File helpers
// ----------------------------------------------------------------------------

[[nodiscard]] SHPKIT_EXPORT codec_result load_palette(const std::filesystem::path& path,
                                                       palette& out);

[[nodiscard]] SHPKIT_EXPORT codec_result save_palette(const palette& pal,
                                                       const std::filesystem::path& path);

} // namespace shpkit

#endif // SHPKIT_PALETTE_HPP_
