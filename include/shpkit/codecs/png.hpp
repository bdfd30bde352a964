#ifndef SHPKIT_CODECS_PNG_HPP_
#define SHPKIT_CODECS_PNG_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace shpkit {

// ============================================================================
// PNG (lodepng)
// ============================================================================
//
// PNG is both an import format and the export format for rendered frames.
// Every color type is decoded to 8-bit RGBA; an APNG decodes to its default
// image.

class SHPKIT_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png", ".apng"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * The IHDR size is checked against options before the image data is
     * inflated.
     */
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data,
                                              surface& surf,
                                              const import_options& options = {});
};

/**
 * Encode a surface as an 8-bit RGBA PNG.
 * @param out Receives the file bytes, untouched on failure
 * @return invalid_dimensions for an empty surface
 */
[[nodiscard]] SHPKIT_EXPORT codec_result encode_png(const memory_surface& surf,
                                                     std::vector<std::uint8_t>& out);

[[nodiscard]] SHPKIT_EXPORT codec_result save_png(const memory_surface& surf,
                                                   const std::filesystem::path& path);

} // namespace shpkit

#endif // SHPKIT_CODECS_PNG_HPP_
