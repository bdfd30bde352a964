#ifndef SHPKIT_RENDER_HPP_
#define SHPKIT_RENDER_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/palette.hpp>
#include <shpkit/sprite.hpp>
#include <shpkit/surface.hpp>

#include <cstddef>
#include <filesystem>

namespace shpkit {

// ============================================================================
// Frame Rendering
// ============================================================================

constexpr float MIN_BRIGHTNESS = 0.2f;
constexpr float MAX_BRIGHTNESS = 3.0f;

/**
 * Render one frame to an RGBA surface of the sprite's size.
 *
 * Each channel is the palette color scaled by options.brightness (clamped to
 * [0.2, 3.0]), rounded and capped at 255. Alpha is 0 for background pixels
 * (index 0) and 255 otherwise. A frame index past the end renders frame 0.
 *
 * An empty sprite, or one larger than options.max_pixels, renders a single
 * opaque black placeholder pixel instead.
 *
 * @return false if the placeholder was produced
 */
SHPKIT_EXPORT bool render_frame(const sprite& spr, const palette& pal,
                                std::size_t frame_index,
                                surface& out,
                                const render_options& options = {});

/**
 * Write one frame as a PNG at brightness 1.0, background transparent.
 * @return invalid_dimensions if frame_index is past the end
 */
[[nodiscard]] SHPKIT_EXPORT codec_result export_frame_png(const sprite& spr,
                                                           const palette& pal,
                                                           std::size_t frame_index,
                                                           const std::filesystem::path& path);

} // namespace shpkit

#endif // SHPKIT_RENDER_HPP_
