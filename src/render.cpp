#include <shpkit/render.hpp>
#include <shpkit/codecs/png.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace shpkit {

namespace {

constexpr std::uint8_t PLACEHOLDER_PIXEL[4] = {0, 0, 0, 255};

std::uint8_t scale_channel(std::uint8_t value, float brightness) noexcept {
    const float scaled = std::round(static_cast<float>(value) * brightness);
    return static_cast<std::uint8_t>(std::min(scaled, 255.0f));
}

bool write_placeholder(surface& out) {
    if (!out.set_size(1, 1)) {
        return false;
    }
    out.write_row(0, PLACEHOLDER_PIXEL);
    return false;
}

} // namespace

bool render_frame(const sprite& spr, const palette& pal,
                  std::size_t frame_index,
                  surface& out,
                  const render_options& options) {
    // Checked before anything proportional to the canvas is allocated
    const std::size_t total = spr.pixel_count();
    if (spr.empty() || total == 0 || total > options.max_pixels) {
        return write_placeholder(out);
    }

    if (!out.set_size(spr.width(), spr.height())) {
        return write_placeholder(out);
    }

    const std::size_t index = frame_index < spr.frame_count() ? frame_index : 0;
    const auto pixels = spr.pixels(index);
    const float brightness = std::clamp(options.brightness, MIN_BRIGHTNESS, MAX_BRIGHTNESS);

    // Brightness-adjusted lookup table, built once per render
    std::uint8_t lut[PALETTE_COLORS][4];
    for (std::size_t i = 0; i < PALETTE_COLORS; ++i) {
        lut[i][0] = scale_channel(pal[i].r, brightness);
        lut[i][1] = scale_channel(pal[i].g, brightness);
        lut[i][2] = scale_channel(pal[i].b, brightness);
        lut[i][3] = i == BACKGROUND_INDEX ? 0 : 255;
    }

    const std::size_t width = static_cast<std::size_t>(spr.width());
    std::vector<std::uint8_t> row(width * RGBA_BYTES);
    for (int y = 0; y < spr.height(); ++y) {
        const std::size_t base = static_cast<std::size_t>(y) * width;
        for (std::size_t x = 0; x < width; ++x) {
            const auto* color = lut[pixels[base + x]];
            std::copy(color, color + RGBA_BYTES, row.begin() + static_cast<std::ptrdiff_t>(x * RGBA_BYTES));
        }
        out.write_row(y, row);
    }

    return true;
}

codec_result export_frame_png(const sprite& spr, const palette& pal,
                              std::size_t frame_index,
                              const std::filesystem::path& path) {
    if (frame_index >= spr.frame_count()) {
        return codec_result::failure(codec_error::invalid_dimensions, "Frame index out of range");
    }

    memory_surface image;
    if (!render_frame(spr, pal, frame_index, image)) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            "Sprite too large to export");
    }
    return save_png(image, path);
}

} // namespace shpkit
