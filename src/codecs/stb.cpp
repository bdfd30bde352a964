// JPEG, GIF and TGA import through stb_image

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_GIF
#define STBI_ONLY_TGA

#include <stb_image.h>

#include <shpkit/codecs/stb_formats.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <string>

namespace shpkit {

namespace {

using stb_pixels = std::unique_ptr<stbi_uc, decltype(&stbi_image_free)>;

bool has_prefix(std::span<const std::uint8_t> data, std::span<const std::uint8_t> prefix) noexcept {
    return data.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), data.begin());
}

// stb_image yields the first frame of an animated GIF
codec_result decode_with_stb(std::span<const std::uint8_t> data,
                             surface& surf,
                             const import_options& options,
                             const char* format) {
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            "Input data exceeds maximum supported size");
    }
    const auto* bytes = data.data();
    const auto length = static_cast<int>(data.size());

    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(bytes, length, &width, &height, &channels)) {
        return codec_result::failure(codec_error::invalid_format,
            std::string(format) + " header error: " + stbi_failure_reason());
    }
    auto result = check_import_size(width, height, options, format);
    if (!result) {
        return result;
    }

    stb_pixels pixels(stbi_load_from_memory(bytes, length, &width, &height, &channels, 4),
                      stbi_image_free);
    if (!pixels) {
        return codec_result::failure(codec_error::invalid_format,
            std::string(format) + " decode error: " + stbi_failure_reason());
    }

    return deliver_rgba(surf, pixels.get(), width, height);
}

} // namespace

// ============================================================================
// JPEG Decoder
// ============================================================================

bool jpeg_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    static constexpr std::uint8_t soi[] = {0xFF, 0xD8, 0xFF};
    return has_prefix(data, soi);
}

codec_result jpeg_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const import_options& options) {
    if (!sniff(data)) {
        return codec_result::failure(codec_error::invalid_format, "Not a valid JPEG file");
    }
    return decode_with_stb(data, surf, options, "JPEG");
}

// ============================================================================
// GIF Decoder
// ============================================================================

bool gif_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    static constexpr std::uint8_t gif87[] = {'G', 'I', 'F', '8', '7', 'a'};
    static constexpr std::uint8_t gif89[] = {'G', 'I', 'F', '8', '9', 'a'};
    return has_prefix(data, gif87) || has_prefix(data, gif89);
}

codec_result gif_decoder::decode(std::span<const std::uint8_t> data,
                                 surface& surf,
                                 const import_options& options) {
    if (!sniff(data)) {
        return codec_result::failure(codec_error::invalid_format, "Not a valid GIF file");
    }
    return decode_with_stb(data, surf, options, "GIF");
}

// ============================================================================
// TGA Decoder
// ============================================================================
//
// TGA has no signature. The 18-byte header is accepted when its color map
// type, image type, depth and size are all plausible.

namespace {

constexpr std::size_t TGA_HEADER_SIZE = 18;

bool tga_image_type_ok(std::uint8_t type) noexcept {
    // 1-3 uncompressed, 9-11 RLE
    return (type >= 1 && type <= 3) || (type >= 9 && type <= 11);
}

bool tga_depth_ok(std::uint8_t bits) noexcept {
    switch (bits) {
        case 8: case 15: case 16: case 24: case 32:
            return true;
        default:
            return false;
    }
}

} // namespace

bool tga_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < TGA_HEADER_SIZE) {
        return false;
    }
    const int width = data[12] | (data[13] << 8);
    const int height = data[14] | (data[15] << 8);
    return data[1] <= 1 &&
           tga_image_type_ok(data[2]) &&
           tga_depth_ok(data[16]) &&
           width > 0 && height > 0;
}

codec_result tga_decoder::decode(std::span<const std::uint8_t> data,
                                 surface& surf,
                                 const import_options& options) {
    if (!sniff(data)) {
        return codec_result::failure(codec_error::invalid_format, "Not a valid TGA file");
    }
    return decode_with_stb(data, surf, options, "TGA");
}

} // namespace shpkit
