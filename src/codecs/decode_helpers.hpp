#pragma once

#include <shpkit/types.hpp>
#include <shpkit/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace shpkit {

// Reject images larger than the import limits before their pixels are decoded
inline codec_result check_import_size(int width, int height, const import_options& options,
                                      const char* format) {
    if (width <= 0 || height <= 0) {
        return codec_result::failure(codec_error::invalid_format,
            std::string(format) + " image has no pixels");
    }
    if (width > options.max_width || height > options.max_height) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            std::string(format) + " image is " + std::to_string(width) + "x" +
            std::to_string(height) + ", larger than the import limit");
    }
    return codec_result::success();
}

// Hand a packed width x height RGBA buffer to a surface
inline codec_result deliver_rgba(surface& surf, const std::uint8_t* rgba, int width, int height) {
    if (!surf.set_size(width, height)) {
        return codec_result::failure(codec_error::internal_error, "Failed to allocate surface");
    }
    const std::size_t stride = static_cast<std::size_t>(width) * RGBA_BYTES;
    for (int y = 0; y < height; ++y) {
        surf.write_row(y, std::span<const std::uint8_t>(rgba + static_cast<std::size_t>(y) * stride, stride));
    }
    return codec_result::success();
}

} // namespace shpkit
