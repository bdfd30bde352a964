#ifndef SHPKIT_TYPES_HPP_
#define SHPKIT_TYPES_HPP_

#include <shpkit/shpkit_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace shpkit {

// ============================================================================
// Colors
// ============================================================================

struct rgb8 {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    friend constexpr bool operator==(const rgb8&, const rgb8&) = default;
};

// ============================================================================
// Errors
// ============================================================================

enum class codec_error {
    none,
    // Sprite codec
    not_a_sprite,
    invalid_dimensions,
    truncated_data,
    offset_out_of_range,
    empty_sprite,
    // Palettes, image import, file access
    invalid_palette,
    invalid_format,
    dimensions_exceeded,
    io_error,
    internal_error
};

[[nodiscard]] SHPKIT_EXPORT const char* to_string(codec_error err) noexcept;

// ============================================================================
// Result
// ============================================================================

struct codec_result {
    bool ok = false;
    codec_error error = codec_error::none;
    std::string message;

    [[nodiscard]] static codec_result success() {
        return {true, codec_error::none, {}};
    }

    [[nodiscard]] static codec_result failure(codec_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Options
// ============================================================================

struct decode_options {
    // Upper bound on width * height * frame_count before frame buffers are
    // allocated. Exceeding it is reported as invalid_dimensions.
    std::size_t max_canvas_bytes = 1024ULL * 1024ULL * 1024ULL;
};

struct import_options {
    int max_width = 16384;
    int max_height = 16384;
    int max_scaled_side = 4096;
    // Source pixels with alpha below this leave the canvas untouched
    std::uint8_t alpha_threshold = 8;
};

struct render_options {
    float brightness = 1.0f;
    std::size_t max_pixels = 64'000'000;
};

} // namespace shpkit

#endif // SHPKIT_TYPES_HPP_
