#ifndef SHPKIT_CODECS_STB_FORMATS_HPP_
#define SHPKIT_CODECS_STB_FORMATS_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace shpkit {

// ============================================================================
// Import Formats Decoded by stb_image
// ============================================================================
//
// Each decoder checks its own signature and then hands the whole file to
// stb_image, requesting four channels. Images larger than
// import_options::max_width x max_height are refused before any pixel data
// is decoded.

class SHPKIT_EXPORT jpeg_decoder {
public:
    static constexpr std::string_view name = "jpeg";
    static constexpr std::string_view extensions[] = {".jpg", ".jpeg", ".jpe", ".jfif"};

    // FF D8 FF
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data, surface& surf,
                                              const import_options& options = {});
};

// Animated GIFs yield their first frame only.
class SHPKIT_EXPORT gif_decoder {
public:
    static constexpr std::string_view name = "gif";
    static constexpr std::string_view extensions[] = {".gif"};

    // "GIF87a" or "GIF89a"
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data, surface& surf,
                                              const import_options& options = {});
};

// TGA has no signature, so it is matched on header plausibility and should
// be tried after every other format.
class SHPKIT_EXPORT tga_decoder {
public:
    static constexpr std::string_view name = "tga";
    static constexpr std::string_view extensions[] = {".tga"};

    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data, surface& surf,
                                              const import_options& options = {});
};

} // namespace shpkit

#endif // SHPKIT_CODECS_STB_FORMATS_HPP_
