#include <doctest/doctest.h>
#include <shpkit/shpkit.hpp>

#include <cstdint>
#include <vector>

namespace {

shpkit::memory_surface make_rgba(int width, int height) {
    shpkit::memory_surface surf;
    REQUIRE(surf.set_size(width, height));
    std::vector<std::uint8_t> row(static_cast<std::size_t>(width) * 4);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const auto i = static_cast<std::size_t>(x) * 4;
            row[i + 0] = static_cast<std::uint8_t>(x * 10);
            row[i + 1] = static_cast<std::uint8_t>(y * 10);
            row[i + 2] = 0;
            row[i + 3] = 255;
        }
        surf.write_row(y, row);
    }
    return surf;
}

} // namespace

TEST_CASE("Import registry: built-in decoders") {
    const auto& registry = shpkit::import_registry::instance();
    CHECK(registry.decoder_count() >= 4);
    CHECK(registry.find_decoder(std::string_view("png")) != nullptr);
    CHECK(registry.find_decoder(std::string_view("jpeg")) != nullptr);
    CHECK(registry.find_decoder(std::string_view("gif")) != nullptr);
    CHECK(registry.find_decoder(std::string_view("tga")) != nullptr);
    CHECK(registry.find_decoder(std::string_view("bmp")) == nullptr);

    SUBCASE("Extension lookup is case-insensitive") {
        const auto* dec = registry.find_decoder_for_extension(".PNG");
        REQUIRE(dec != nullptr);
        CHECK(dec->name() == "png");
    }
}

TEST_CASE("Import: PNG") {
    const auto source = make_rgba(3, 2);
    std::vector<std::uint8_t> png;
    REQUIRE(shpkit::encode_png(source, png).ok);

    SUBCASE("Sniffed and decoded to RGBA") {
        shpkit::memory_surface decoded;
        REQUIRE(shpkit::decode_image(png, decoded).ok);
        CHECK(decoded.width() == 3);
        CHECK(decoded.height() == 2);
        const auto a = source.pixels();
        const auto b = decoded.pixels();
        CHECK(std::vector<std::uint8_t>(a.begin(), a.end()) ==
              std::vector<std::uint8_t>(b.begin(), b.end()));
    }

    SUBCASE("Dimension limits") {
        shpkit::import_options options;
        options.max_width = 2;
        shpkit::memory_surface decoded;
        auto result = shpkit::decode_image(png, decoded, options);
        CHECK(result.error == shpkit::codec_error::dimensions_exceeded);
    }
}

TEST_CASE("Import: encode_png rejects an empty surface") {
    shpkit::memory_surface empty;
    std::vector<std::uint8_t> png = {1};
    CHECK(shpkit::encode_png(empty, png).error == shpkit::codec_error::invalid_dimensions);
    CHECK(png.size() == 1);
}

TEST_CASE("Import: unknown data") {
    // Starts like nothing the registry recognizes and is too short for TGA
    std::vector<std::uint8_t> data = {'S', 'H', 'P', 0};
    shpkit::memory_surface decoded;
    auto result = shpkit::decode_image(data, decoded);
    CHECK_FALSE(result.ok);
    CHECK(result.error == shpkit::codec_error::invalid_format);
}

TEST_CASE("Import: scale_nearest") {
    const auto source = make_rgba(4, 2);
    shpkit::memory_surface scaled;

    SUBCASE("Upscale doubles each pixel") {
        REQUIRE(shpkit::scale_nearest(source, 2.0f, scaled).ok);
        CHECK(scaled.width() == 8);
        CHECK(scaled.height() == 4);
        CHECK(scaled.rgba_at(0, 0)[0] == 0);
        CHECK(scaled.rgba_at(1, 0)[0] == 0);
        CHECK(scaled.rgba_at(2, 0)[0] == 10);
        CHECK(scaled.rgba_at(7, 3)[0] == 30);
        CHECK(scaled.rgba_at(7, 3)[1] == 10);
    }

    SUBCASE("Never smaller than 1x1") {
        REQUIRE(shpkit::scale_nearest(source, 0.01f, scaled).ok);
        CHECK(scaled.width() == 1);
        CHECK(scaled.height() == 1);
    }

    SUBCASE("Clamped proportionally to the maximum side") {
        REQUIRE(shpkit::scale_nearest(source, 100.0f, scaled, 40).ok);
        CHECK(scaled.width() == 40);
        CHECK(scaled.height() == 20);
    }

    SUBCASE("Invalid scale") {
        CHECK_FALSE(shpkit::scale_nearest(source, 0.0f, scaled).ok);
        CHECK_FALSE(shpkit::scale_nearest(source, -1.0f, scaled).ok);
    }

    SUBCASE("Empty source") {
        shpkit::memory_surface empty;
        CHECK(shpkit::scale_nearest(empty, 1.0f, scaled).error == shpkit::codec_error::invalid_format);
    }
}
