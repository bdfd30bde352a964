#ifndef SHPKIT_IMPORT_HPP_
#define SHPKIT_IMPORT_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace shpkit {

// ============================================================================
// Image Import
// ============================================================================
//
// External artwork enters a sprite in two steps: a true-color decoder turns
// the file into an RGBA surface, then raster.hpp's paste_quantized maps it
// onto the palette. Only the first image of an animated file is imported.

class SHPKIT_EXPORT image_decoder {
public:
    virtual ~image_decoder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data) const noexcept = 0;
    [[nodiscard]] virtual codec_result decode(std::span<const std::uint8_t> data,
                                              surface& surf,
                                              const import_options& options) const = 0;
};

/**
 * Process-wide list of import decoders, tried in registration order.
 * PNG, JPEG and GIF are built in, followed by TGA, which has no signature
 * and so must come last. Decoders added later are tried after TGA.
 */
class SHPKIT_EXPORT import_registry {
public:
    [[nodiscard]] static import_registry& instance();

    void register_decoder(std::unique_ptr<image_decoder> dec);

    // First decoder whose sniff() accepts data, or nullptr
    [[nodiscard]] const image_decoder* find_decoder(std::span<const std::uint8_t> data) const;

    // Lookup by decoder name, e.g. "png"
    [[nodiscard]] const image_decoder* find_decoder(std::string_view name) const;

    // Case-insensitive lookup by extension including the dot, e.g. ".JPG"
    [[nodiscard]] const image_decoder* find_decoder_for_extension(std::string_view ext) const;

    [[nodiscard]] std::size_t decoder_count() const noexcept { return decoders_.size(); }
    [[nodiscard]] const image_decoder* decoder_at(std::size_t index) const noexcept {
        return index < decoders_.size() ? decoders_[index].get() : nullptr;
    }

private:
    import_registry();
    ~import_registry();

    import_registry(const import_registry&) = delete;
    import_registry& operator=(const import_registry&) = delete;

    std::vector<std::unique_ptr<image_decoder>> decoders_;
};

/**
 * Decode an image of any registered format.
 * @return invalid_format if no decoder recognises the data,
 *         dimensions_exceeded if it is larger than the import limits
 */
[[nodiscard]] SHPKIT_EXPORT codec_result decode_image(std::span<const std::uint8_t> data,
                                                       surface& surf,
                                                       const import_options& options = {});

/**
 * Read and decode an image file. surf is untouched on failure.
 */
[[nodiscard]] SHPKIT_EXPORT codec_result load_image(const std::filesystem::path& path,
                                                     memory_surface& surf,
                                                     const import_options& options = {});

/**
 * Nearest-neighbour resize to round(w * scale) x round(h * scale).
 * Each side is at least 1; if either side would exceed max_side, both are
 * shrunk by the same factor.
 * @return invalid_format for an empty source,
 *         dimensions_exceeded for a scale that is not a positive number
 */
[[nodiscard]] SHPKIT_EXPORT codec_result scale_nearest(const memory_surface& src,
                                                        float scale,
                                                        memory_surface& out,
                                                        int max_side = 4096);

} // namespace shpkit

#endif // SHPKIT_IMPORT_HPP_
