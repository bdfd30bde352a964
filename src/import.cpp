#include <shpkit/import.hpp>
#include <shpkit/file_io.hpp>
#include <shpkit/codecs/png.hpp>
#include <shpkit/codecs/stb_formats.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>

namespace shpkit {

// ============================================================================
// Decoder Wrappers
// ============================================================================

namespace {

template <typename Codec>
class decoder_impl : public image_decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Codec::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return Codec::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return Codec::sniff(data);
    }

    [[nodiscard]] codec_result decode(std::span<const std::uint8_t> data,
                                      surface& surf,
                                      const import_options& options) const override {
        return Codec::decode(data, surf, options);
    }
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

// ============================================================================
// Import Registry
// ============================================================================

import_registry& import_registry::instance() {
    static import_registry registry;
    return registry;
}

import_registry::import_registry() {
    decoders_.push_back(std::make_unique<decoder_impl<png_decoder>>());
    decoders_.push_back(std::make_unique<decoder_impl<jpeg_decoder>>());
    decoders_.push_back(std::make_unique<decoder_impl<gif_decoder>>());
    decoders_.push_back(std::make_unique<decoder_impl<tga_decoder>>());
}

import_registry::~import_registry() = default;

void import_registry::register_decoder(std::unique_ptr<image_decoder> dec) {
    if (dec) {
        decoders_.push_back(std::move(dec));
    }
}

const image_decoder* import_registry::find_decoder(std::span<const std::uint8_t> data) const {
    for (const auto& dec : decoders_) {
        if (dec->sniff(data)) {
            return dec.get();
        }
    }
    return nullptr;
}

const image_decoder* import_registry::find_decoder(std::string_view name) const {
    for (const auto& dec : decoders_) {
        if (dec->name() == name) {
            return dec.get();
        }
    }
    return nullptr;
}

const image_decoder* import_registry::find_decoder_for_extension(std::string_view ext) const {
    for (const auto& dec : decoders_) {
        for (const auto& candidate : dec->extensions()) {
            if (iequals(candidate, ext)) {
                return dec.get();
            }
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

codec_result decode_image(std::span<const std::uint8_t> data,
                          surface& surf,
                          const import_options& options) {
    const auto* dec = import_registry::instance().find_decoder(data);
    if (!dec) {
        return codec_result::failure(codec_error::invalid_format, "Unknown image format");
    }
    return dec->decode(data, surf, options);
}

codec_result load_image(const std::filesystem::path& path,
                        memory_surface& surf,
                        const import_options& options) {
    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) {
        return result;
    }

    // Decode into a scratch surface so a failure leaves surf untouched
    memory_surface decoded;
    result = decode_image(data, decoded, options);
    if (!result) {
        return result;
    }
    surf = std::move(decoded);
    return codec_result::success();
}

codec_result scale_nearest(const memory_surface& src, float scale,
                           memory_surface& out, int max_side) {
    if (src.empty()) {
        return codec_result::failure(codec_error::invalid_format, "Cannot scale an empty image");
    }
    if (!(scale > 0.0f) || !std::isfinite(scale)) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            "Scale factor must be a positive number");
    }
    max_side = std::max(max_side, 1);

    double sw = std::max(1.0, std::round(static_cast<double>(src.width()) * scale));
    double sh = std::max(1.0, std::round(static_cast<double>(src.height()) * scale));
    if (sw > max_side) {
        const double k = max_side / sw;
        sw = max_side;
        sh = std::max(1.0, std::round(sh * k));
    }
    if (sh > max_side) {
        const double k = max_side / sh;
        sh = max_side;
        sw = std::max(1.0, std::round(sw * k));
    }

    const int dst_w = static_cast<int>(sw);
    const int dst_h = static_cast<int>(sh);

    memory_surface scaled;
    if (!scaled.set_size(dst_w, dst_h)) {
        return codec_result::failure(codec_error::internal_error, "Failed to allocate surface");
    }

    std::vector<std::uint8_t> row(scaled.row_bytes());
    for (int y = 0; y < dst_h; ++y) {
        const int sy = static_cast<int>(static_cast<long long>(y) * src.height() / dst_h);
        for (int x = 0; x < dst_w; ++x) {
            const int sx = static_cast<int>(static_cast<long long>(x) * src.width() / dst_w);
            const std::uint8_t* px = src.rgba_at(sx, sy);
            std::copy(px, px + RGBA_BYTES, row.begin() + static_cast<std::ptrdiff_t>(x * RGBA_BYTES));
        }
        scaled.write_row(y, row);
    }

    out = std::move(scaled);
    return codec_result::success();
}

} // namespace shpkit
