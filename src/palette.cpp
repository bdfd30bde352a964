#include <shpkit/palette.hpp>
#include <shpkit/file_io.hpp>

namespace shpkit {

palette palette::grayscale() noexcept {
    palette pal;
    for (std::size_t i = 0; i < PALETTE_COLORS; ++i) {
        const auto v = static_cast<std::uint8_t>(i);
        pal.colors_[i] = {v, v, v};
    }
    return pal;
}

codec_result palette::parse(std::span<const std::uint8_t> data, palette& out) {
    if (data.size() < PALETTE_FILE_SIZE) {
        return codec_result::failure(codec_error::invalid_palette,
            "Palette too small: expected 768 bytes");
    }

    palette pal;
    for (std::size_t i = 0; i < PALETTE_COLORS; ++i) {
        pal.colors_[i] = {data[i * 3 + 0], data[i * 3 + 1], data[i * 3 + 2]};
    }

    out = pal;
    return codec_result::success();
}

std::vector<std::uint8_t> palette::to_bytes() const {
    std::vector<std::uint8_t> out;
    out.reserve(PALETTE_FILE_SIZE);
    for (const auto& c : colors_) {
        out.push_back(c.r);
        out.push_back(c.g);
        out.push_back(c.b);
    }
    return out;
}

codec_result load_palette(const std::filesystem::path& path, palette& out) {
    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) {
        return result;
    }
    return palette::parse(data, out);
}

codec_result save_palette(const palette& pal, const std::filesystem::path& path) {
    const auto bytes = pal.to_bytes();
    return write_file(path, bytes);
}

} // namespace shpkit
