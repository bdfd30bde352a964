#include <shpkit/codecs/png.hpp>
#include <shpkit/file_io.hpp>
#include "decode_helpers.hpp"
#include <lodepng.h>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace shpkit {

namespace {

constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

codec_result lodepng_failure(codec_error err, const char* what, unsigned code) {
    return codec_result::failure(err, std::string(what) + ": " + lodepng_error_text(code));
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= sizeof(PNG_SIGNATURE) &&
           std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), data.begin());
}

codec_result png_decoder::decode(std::span<const std::uint8_t> data,
                                 surface& surf,
                                 const import_options& options) {
    if (!sniff(data)) {
        return codec_result::failure(codec_error::invalid_format, "Not a valid PNG file");
    }

    // Read the header only, so oversized images are rejected before inflating
    lodepng::State state;
    unsigned width = 0;
    unsigned height = 0;
    unsigned error = lodepng_inspect(&width, &height, &state, data.data(), data.size());
    if (error) {
        return lodepng_failure(codec_error::invalid_format, "PNG header error", error);
    }

    constexpr auto max_int = static_cast<unsigned>(std::numeric_limits<int>::max());
    if (width > max_int || height > max_int) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            "PNG dimensions exceed maximum supported size");
    }
    auto result = check_import_size(static_cast<int>(width), static_cast<int>(height), options, "PNG");
    if (!result) {
        return result;
    }

    // State defaults to 8-bit RGBA output; APNG chunks are skipped
    std::vector<std::uint8_t> rgba;
    error = lodepng::decode(rgba, width, height, state, data.data(), data.size());
    if (error) {
        return lodepng_failure(codec_error::invalid_format, "PNG decode error", error);
    }

    return deliver_rgba(surf, rgba.data(), static_cast<int>(width), static_cast<int>(height));
}

// ============================================================================
// PNG Encoder
// ============================================================================

codec_result encode_png(const memory_surface& surf, std::vector<std::uint8_t>& out) {
    if (surf.empty()) {
        return codec_result::failure(codec_error::invalid_dimensions, "Cannot encode an empty image");
    }

    std::vector<std::uint8_t> png;
    const unsigned error = lodepng::encode(png, surf.pixels().data(),
                                           static_cast<unsigned>(surf.width()),
                                           static_cast<unsigned>(surf.height()));
    if (error) {
        return lodepng_failure(codec_error::internal_error, "PNG encode error", error);
    }

    out = std::move(png);
    return codec_result::success();
}

codec_result save_png(const memory_surface& surf, const std::filesystem::path& path) {
    std::vector<std::uint8_t> png;
    auto result = encode_png(surf, png);
    if (!result) {
        return result;
    }
    return write_file(path, png);
}

} // namespace shpkit
