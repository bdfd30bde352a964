#include <shpkit/codecs/shp.hpp>
#include <shpkit/file_io.hpp>
#include "byte_io.hpp"

#include <algorithm>
#include <limits>
#include <new>
#include <utility>

namespace shpkit {

namespace {

constexpr std::size_t ROW_LENGTH_FIELD_SIZE = 2;

// Writes a decoded pixel into the full canvas, dropping anything outside it.
class canvas_writer {
public:
    canvas_writer(frame& target, int width, int height) noexcept
        : pixels_(target.pixels),
          width_(static_cast<std::size_t>(width)),
          height_(static_cast<std::size_t>(height)) {}

    void put(std::size_t x, std::size_t y, std::uint8_t value) noexcept {
        if (x < width_ && y < height_) {
            pixels_[y * width_ + x] = value;
        }
    }

private:
    std::vector<std::uint8_t>& pixels_;
    std::size_t width_;
    std::size_t height_;
};

codec_result truncated(const char* what) {
    return codec_result::failure(codec_error::truncated_data, what);
}

} // namespace

const char* to_string(shp_compression compression) noexcept {
    switch (compression) {
        case shp_compression::uncompressed: return "uncompressed";
        case shp_compression::scanline:     return "scanline";
        case shp_compression::rle0:         return "rle0";
    }
    return "unknown";
}

// ============================================================================
// SHP Decoder
// ============================================================================

bool shp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < SHP_FILE_HEADER_SIZE) {
        return false;
    }

    const auto* p = data.data();
    if (read_le16(p) != 0) {
        return false;
    }

    const std::size_t width = read_le16(p + 2);
    const std::size_t height = read_le16(p + 4);
    const std::size_t frame_count = read_le16(p + 6);
    if (width == 0 || height == 0 || frame_count == 0) {
        return false;
    }

    return SHP_FILE_HEADER_SIZE + frame_count * SHP_FRAME_HEADER_SIZE <= data.size();
}

codec_result shp_decoder::parse_header(std::span<const std::uint8_t> data,
                                       header_info& info,
                                       std::vector<frame_header>& frames,
                                       const decode_options& options) {
    if (data.size() < SHP_FILE_HEADER_SIZE) {
        return codec_result::failure(codec_error::invalid_dimensions,
            "SHP file too small: expected at least 8 bytes");
    }

    byte_reader reader(data);
    std::uint16_t zero = 0;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint16_t frame_count = 0;
    if (!reader.read_u16(zero) || !reader.read_u16(width) ||
        !reader.read_u16(height) || !reader.read_u16(frame_count)) {
        return truncated("SHP file header truncated");
    }

    if (zero != 0) {
        return codec_result::failure(codec_error::not_a_sprite,
            "Not a valid SHP file: header marker is not zero");
    }

    if (width == 0 || height == 0 || frame_count == 0) {
        return codec_result::failure(codec_error::invalid_dimensions,
            "Invalid SHP dimensions or frame count");
    }

    const std::size_t canvas = static_cast<std::size_t>(width) * height;
    if (canvas > options.max_canvas_bytes / frame_count) {
        return codec_result::failure(codec_error::invalid_dimensions,
            "SHP canvas size exceeds decode limits");
    }

    std::vector<frame_header> headers;
    headers.reserve(frame_count);

    for (std::size_t i = 0; i < frame_count; ++i) {
        std::uint16_t x = 0;
        std::uint16_t y = 0;
        std::uint16_t w = 0;
        std::uint16_t h = 0;
        std::uint32_t flags = 0;
        std::uint32_t reserved = 0;
        std::uint32_t data_offset = 0;

        if (!reader.read_u16(x) || !reader.read_u16(y) ||
            !reader.read_u16(w) || !reader.read_u16(h) ||
            !reader.read_u32(flags) ||
            !reader.skip(4) ||               // frame color
            !reader.read_u32(reserved) ||
            !reader.read_u32(data_offset)) {
            return truncated("SHP frame header truncated");
        }

        headers.push_back({x, y, w, h, flags, data_offset});
    }

    info = {static_cast<int>(width), static_cast<int>(height), frame_count};
    frames = std::move(headers);
    return codec_result::success();
}

codec_result shp_decoder::decode_frame(std::span<const std::uint8_t> data,
                                       const frame_header& fh,
                                       int canvas_width,
                                       int canvas_height,
                                       frame& out) {
    if (fh.is_empty()) {
        return codec_result::success();
    }

    if (fh.data_offset >= data.size()) {
        return codec_result::failure(codec_error::offset_out_of_range,
            "SHP frame data offset past end of file");
    }

    byte_reader reader(data, fh.data_offset);
    canvas_writer canvas(out, canvas_width, canvas_height);

    const std::size_t x0 = static_cast<std::size_t>(fh.x);
    const std::size_t y0 = static_cast<std::size_t>(fh.y);
    const std::size_t rows = static_cast<std::size_t>(fh.h);

    switch (fh.compression()) {
        case shp_compression::rle0: {
            for (std::size_t row = 0; row < rows; ++row) {
                std::uint16_t length = 0;
                if (!reader.read_u16(length)) {
                    return truncated("SHP RLE row length truncated");
                }

                // The declared length is trusted; the reconstructed pixel
                // count is not checked against the subrect width.
                std::size_t remaining = length > ROW_LENGTH_FIELD_SIZE ? length - ROW_LENGTH_FIELD_SIZE : 0;
                std::size_t x = x0;
                while (remaining > 0) {
                    std::uint8_t value = 0;
                    if (!reader.read_u8(value)) {
                        return truncated("SHP RLE row data truncated");
                    }
                    --remaining;

                    if (value != 0) {
                        canvas.put(x, y0 + row, value);
                        ++x;
                        continue;
                    }

                    // A zero in the last declared byte has no count byte
                    if (remaining == 0) {
                        break;
                    }
                    std::uint8_t run = 0;
                    if (!reader.read_u8(run)) {
                        return truncated("SHP RLE run truncated");
                    }
                    --remaining;
                    x += run;
                }
            }
            break;
        }

        case shp_compression::scanline: {
            for (std::size_t row = 0; row < rows; ++row) {
                std::uint16_t length = 0;
                if (!reader.read_u16(length)) {
                    return truncated("SHP scanline row length truncated");
                }

                const std::size_t count = length > ROW_LENGTH_FIELD_SIZE ? length - ROW_LENGTH_FIELD_SIZE : 0;
                std::span<const std::uint8_t> bytes;
                if (!reader.read_bytes(count, bytes)) {
                    return truncated("SHP scanline row data truncated");
                }
                for (std::size_t i = 0; i < count; ++i) {
                    canvas.put(x0 + i, y0 + row, bytes[i]);
                }
            }
            break;
        }

        case shp_compression::uncompressed: {
            const std::size_t row_bytes = static_cast<std::size_t>(fh.w);
            for (std::size_t row = 0; row < rows; ++row) {
                std::span<const std::uint8_t> bytes;
                if (!reader.read_bytes(row_bytes, bytes)) {
                    return truncated("SHP uncompressed frame data truncated");
                }
                for (std::size_t i = 0; i < row_bytes; ++i) {
                    canvas.put(x0 + i, y0 + row, bytes[i]);
                }
            }
            break;
        }
    }

    return codec_result::success();
}

codec_result shp_decoder::decode(std::span<const std::uint8_t> data,
                                 sprite& out,
                                 const decode_options& options) {
    header_info info;
    std::vector<frame_header> headers;
    auto result = parse_header(data, info, headers, options);
    if (!result) {
        return result;
    }

    try {
        sprite decoded(info.width, info.height, 0);
        for (std::size_t i = 0; i < headers.size(); ++i) {
            frame& target = decoded.add_frame();
            result = decode_frame(data, headers[i], info.width, info.height, target);
            if (!result) {
                result.message += " (frame " + std::to_string(i) + ")";
                return result;
            }
        }
        out = std::move(decoded);
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::internal_error,
            "Failed to allocate SHP frame buffers");
    }

    return codec_result::success();
}

codec_result load_shp(const std::filesystem::path& path, sprite& out,
                      const decode_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) {
        return result;
    }
    return shp_decoder::decode(data, out, options);
}

// ============================================================================
// SHP Encoder
// ============================================================================

codec_result encode_shp(const sprite& spr, std::vector<std::uint8_t>& out) {
    const std::size_t frame_count = spr.frame_count();
    if (frame_count == 0) {
        return codec_result::failure(codec_error::empty_sprite, "Sprite has no frames");
    }

    if (static_cast<std::size_t>(spr.width()) > SHP_MAX_DIMENSION ||
        static_cast<std::size_t>(spr.height()) > SHP_MAX_DIMENSION ||
        frame_count > SHP_MAX_FRAMES) {
        return codec_result::failure(codec_error::invalid_dimensions,
            "Sprite exceeds SHP limits (65535 pixels per side, 65535 frames)");
    }

    const std::size_t canvas = spr.pixel_count();
    const std::size_t header_size = SHP_FILE_HEADER_SIZE + SHP_FRAME_HEADER_SIZE * frame_count;

    // Data offsets; 0 marks an all-background frame with no data block
    std::vector<std::uint32_t> offsets(frame_count, 0);
    std::size_t cursor = header_size;
    for (std::size_t i = 0; i < frame_count; ++i) {
        const auto& pixels = spr.frame_at(i).pixels;
        if (pixels.size() != canvas) {
            return codec_result::failure(codec_error::invalid_dimensions,
                "Frame " + std::to_string(i) + " does not match the canvas size");
        }

        const bool blank = std::all_of(pixels.begin(), pixels.end(),
                                       [](std::uint8_t v) { return v == BACKGROUND_INDEX; });
        if (blank) {
            continue;
        }

        if (cursor > std::numeric_limits<std::uint32_t>::max()) {
            return codec_result::failure(codec_error::invalid_dimensions,
                "Encoded SHP exceeds 32-bit data offsets");
        }
        offsets[i] = static_cast<std::uint32_t>(cursor);
        cursor += canvas;
    }

    std::vector<std::uint8_t> data;
    try {
        data.reserve(cursor);
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::internal_error,
            "Failed to allocate SHP output buffer");
    }

    write_le16(data, 0);
    write_le16(data, static_cast<std::uint16_t>(spr.width()));
    write_le16(data, static_cast<std::uint16_t>(spr.height()));
    write_le16(data, static_cast<std::uint16_t>(frame_count));

    for (std::size_t i = 0; i < frame_count; ++i) {
        write_le16(data, 0);                                       // x
        write_le16(data, 0);                                       // y
        write_le16(data, static_cast<std::uint16_t>(spr.width()));  // w
        write_le16(data, static_cast<std::uint16_t>(spr.height())); // h
        write_le32(data, 0);                                       // flags: uncompressed
        write_le32(data, 0);                                       // frame color
        write_le32(data, 0);                                       // reserved
        write_le32(data, offsets[i]);
    }

    for (std::size_t i = 0; i < frame_count; ++i) {
        if (offsets[i] == 0) {
            continue;
        }
        const auto& pixels = spr.frame_at(i).pixels;
        data.insert(data.end(), pixels.begin(), pixels.end());
    }

    out = std::move(data);
    return codec_result::success();
}

codec_result save_shp(const sprite& spr, const std::filesystem::path& path) {
    std::vector<std::uint8_t> data;
    auto result = encode_shp(spr, data);
    if (!result) {
        return result;
    }
    return write_file(path, data);
}

} // namespace shpkit
