#ifndef SHPKIT_CODECS_SHP_HPP_
#define SHPKIT_CODECS_SHP_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/sprite.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace shpkit {

// ============================================================================
// SHP (TS/RA2) Sprite Format
// ============================================================================
//
// File layout, all fields little-endian:
//   u16 zero, u16 width, u16 height, u16 frame_count
//   frame_count x 24-byte frame headers:
//     u16 x, u16 y, u16 w, u16 h   subrect inside the canvas
//     u32 flags                    compression selector (low two bits)
//     u8[4] frame color            ignored
//     u32 reserved                 ignored
//     u32 data_offset              0 means the frame is all background
//   frame data blocks addressed by data_offset
//
// Compression, selected by flags & 3:
//   3    RLE0: per row a u16 length (including itself), then bytes where a
//        nonzero byte is a pixel and 0, n skips n background pixels
//   2    scanline: per row a u16 length (including itself), then literal pixels
//   else uncompressed: w * h raw bytes

constexpr std::size_t SHP_FILE_HEADER_SIZE = 8;
constexpr std::size_t SHP_FRAME_HEADER_SIZE = 24;
constexpr std::size_t SHP_MAX_DIMENSION = 0xFFFF;
constexpr std::size_t SHP_MAX_FRAMES = 0xFFFF;

constexpr std::uint32_t SHP_FLAG_TRANSPARENT = 0x01;
constexpr std::uint32_t SHP_FLAG_SCANLINE = 0x02;
constexpr std::uint32_t SHP_COMPRESSION_MASK = 0x03;
constexpr std::uint32_t SHP_COMPRESSION_RLE0 = 0x03;

enum class shp_compression {
    uncompressed,
    scanline,
    rle0
};

[[nodiscard]] constexpr shp_compression shp_compression_for_flags(std::uint32_t flags) noexcept {
    if ((flags & SHP_COMPRESSION_MASK) == SHP_COMPRESSION_RLE0) {
        return shp_compression::rle0;
    }
    if ((flags & SHP_FLAG_SCANLINE) != 0 && (flags & SHP_FLAG_TRANSPARENT) == 0) {
        return shp_compression::scanline;
    }
    return shp_compression::uncompressed;
}

[[nodiscard]] SHPKIT_EXPORT const char* to_string(shp_compression compression) noexcept;

// ============================================================================
// SHP Decoder
// ============================================================================

class SHPKIT_EXPORT shp_decoder {
public:
    static constexpr std::string_view name = "shp";
    static constexpr std::string_view extensions[] = {".shp"};

    struct header_info {
        int width = 0;
        int height = 0;
        std::size_t frame_count = 0;
    };

    struct frame_header {
        int x = 0;
        int y = 0;
        int w = 0;
        int h = 0;
        std::uint32_t flags = 0;
        std::uint32_t data_offset = 0;

        [[nodiscard]] bool is_empty() const noexcept {
            return data_offset == 0 || w == 0 || h == 0;
        }
        [[nodiscard]] shp_compression compression() const noexcept {
            return shp_compression_for_flags(flags);
        }
    };

    /**
     * Check if data appears to be an SHP file.
     * @param data Raw file data
     * @return true if the header is plausible and all frame headers fit
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Parse the file header and all frame headers without decoding pixels.
     * @param data Raw file data
     * @param info Receives canvas size and frame count
     * @param frames Receives one entry per frame header
     * @param options Decode options
     */
    [[nodiscard]] static codec_result parse_header(std::span<const std::uint8_t> data,
                                                    header_info& info,
                                                    std::vector<frame_header>& frames,
                                                    const decode_options& options = {});

    /**
     * Decode SHP data into a sprite.
     * Every output frame is a full width * height canvas. Pixels falling
     * outside the canvas are dropped.
     * @param data Raw file data
     * @param out Destination, untouched on failure
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data,
                                              sprite& out,
                                              const decode_options& options = {});

private:
    [[nodiscard]] static codec_result decode_frame(std::span<const std::uint8_t> data,
                                                    const frame_header& fh,
                                                    int canvas_width,
                                                    int canvas_height,
                                                    frame& out);
};

// ============================================================================
// SHP Encoder Functions
// ============================================================================

/**
 * Encode a sprite in the uncompressed SHP layout.
 * All-background frames are written with data_offset 0 and no data block;
 * every other frame covers the whole canvas.
 * @param spr Source sprite
 * @param out Receives the encoded file, untouched on failure
 * @return empty_sprite if the sprite has no frames
 */
[[nodiscard]] SHPKIT_EXPORT codec_result encode_shp(const sprite& spr,
                                                     std::vector<std::uint8_t>& out);

/**
 * Encode a sprite and write it to a file.
 */
[[nodiscard]] SHPKIT_EXPORT codec_result save_shp(const sprite& spr,
                                                   const std::filesystem::path& path);

/**
 * Read and decode an SHP file.
 */
[[nodiscard]] SHPKIT_EXPORT codec_result load_shp(const std::filesystem::path& path,
                                                   sprite& out,
                                                   const decode_options& options = {});

} // namespace shpkit

#endif // SHPKIT_CODECS_SHP_HPP_
