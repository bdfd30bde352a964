#ifndef SHPKIT_RASTER_HPP_
#define SHPKIT_RASTER_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/palette.hpp>
#include <shpkit/sprite.hpp>
#include <shpkit/surface.hpp>

#include <cstddef>
#include <cstdint>

namespace shpkit {

// ============================================================================
// Raster Operations
// ============================================================================
//
// Every operation draws into one frame of a sprite. Coordinates outside the
// canvas and frame indices past the end are ignored, never reported: a shape
// that is partially off-canvas draws only its visible part.

constexpr std::uint8_t DEFAULT_ALPHA_THRESHOLD = 8;

SHPKIT_EXPORT void set_pixel(sprite& spr, std::size_t frame_index, int x, int y,
                             std::uint8_t color) noexcept;

// Returns 0 for out-of-range coordinates or frames
[[nodiscard]] SHPKIT_EXPORT std::uint8_t get_pixel(const sprite& spr, std::size_t frame_index,
                                                    int x, int y) noexcept;

/**
 * Bresenham line, both endpoints included.
 */
SHPKIT_EXPORT void draw_line(sprite& spr, std::size_t frame_index,
                             int x0, int y0, int x1, int y1, std::uint8_t color) noexcept;

/**
 * Round brush stamp. A diameter of 0 or 1 paints a single pixel; larger
 * values fill a disc of radius max(1, (diameter - 1) / 2).
 */
SHPKIT_EXPORT void stamp_disc(sprite& spr, std::size_t frame_index,
                              int cx, int cy, int diameter, std::uint8_t color) noexcept;

/**
 * Midpoint circle outline. Radius <= 0 draws nothing.
 */
SHPKIT_EXPORT void draw_circle(sprite& spr, std::size_t frame_index,
                               int cx, int cy, int radius, std::uint8_t color) noexcept;

/**
 * Filled disc: every pixel with dx^2 + dy^2 <= radius^2. Radius <= 0 draws nothing.
 */
SHPKIT_EXPORT void fill_circle(sprite& spr, std::size_t frame_index,
                               int cx, int cy, int radius, std::uint8_t color) noexcept;

/**
 * Rectangle outline between two corners, in either order.
 */
SHPKIT_EXPORT void draw_rect(sprite& spr, std::size_t frame_index,
                             int x0, int y0, int x1, int y1, std::uint8_t color) noexcept;

/**
 * Filled rectangle between two corners, inclusive, in either order.
 */
SHPKIT_EXPORT void fill_rect(sprite& spr, std::size_t frame_index,
                             int x0, int y0, int x1, int y1, std::uint8_t color) noexcept;

/**
 * 4-connected flood fill of the region holding the seed pixel's color.
 * Does nothing when the seed already has new_color.
 */
SHPKIT_EXPORT void flood_fill(sprite& spr, std::size_t frame_index,
                              int x, int y, std::uint8_t new_color);

/**
 * Quantize an RGBA image into the frame with its top-left corner at
 * (dest_x, dest_y). Source pixels with alpha below alpha_threshold leave
 * the frame untouched.
 */
SHPKIT_EXPORT void paste_quantized(sprite& spr, std::size_t frame_index,
                                   const memory_surface& source,
                                   int dest_x, int dest_y,
                                   const palette& pal,
                                   std::uint8_t alpha_threshold = DEFAULT_ALPHA_THRESHOLD);

/**
 * paste_quantized with the source centred on the canvas.
 */
SHPKIT_EXPORT void paste_centered(sprite& spr, std::size_t frame_index,
                                  const memory_surface& source,
                                  const palette& pal,
                                  std::uint8_t alpha_threshold = DEFAULT_ALPHA_THRESHOLD);

} // namespace shpkit

#endif // SHPKIT_RASTER_HPP_
