#include <doctest/doctest.h>
#include <shpkit/shpkit.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace {

shpkit::palette test_palette() {
    shpkit::palette pal = shpkit::palette::grayscale();
    pal[1] = {100, 150, 200};
    pal[2] = {255, 128, 0};
    return pal;
}

} // namespace

TEST_CASE("Render: colors and alpha") {
    shpkit::sprite spr(2, 1, 1);
    shpkit::set_pixel(spr, 0, 1, 0, 1);
    const auto pal = test_palette();

    shpkit::memory_surface out;
    REQUIRE(shpkit::render_frame(spr, pal, 0, out));
    REQUIRE(out.width() == 2);
    REQUIRE(out.height() == 1);

    const std::vector<std::uint8_t> expected = {0, 0, 0, 0, 100, 150, 200, 255};
    const auto px = out.pixels();
    CHECK(std::vector<std::uint8_t>(px.begin(), px.end()) == expected);
}

TEST_CASE("Render: brightness") {
    shpkit::sprite spr(1, 1, 1);
    shpkit::set_pixel(spr, 0, 0, 0, 2);
    const auto pal = test_palette();
    shpkit::memory_surface out;
    shpkit::render_options options;

    SUBCASE("Scaled and capped") {
        options.brightness = 1.5f;
        REQUIRE(shpkit::render_frame(spr, pal, 0, out, options));
        CHECK(out.rgba_at(0, 0)[0] == 255);
        CHECK(out.rgba_at(0, 0)[1] == 192);
        CHECK(out.rgba_at(0, 0)[2] == 0);
        CHECK(out.rgba_at(0, 0)[3] == 255);
    }

    SUBCASE("Clamped to the lower bound") {
        options.brightness = 0.0f;
        REQUIRE(shpkit::render_frame(spr, pal, 0, out, options));
        CHECK(out.rgba_at(0, 0)[0] == 51);
        CHECK(out.rgba_at(0, 0)[1] == 26);
    }

    SUBCASE("Alpha does not depend on brightness") {
        shpkit::sprite two(2, 1, 1);
        shpkit::set_pixel(two, 0, 1, 0, 2);
        for (float b : {0.2f, 1.0f, 3.0f}) {
            options.brightness = b;
            REQUIRE(shpkit::render_frame(two, pal, 0, out, options));
            CHECK(out.rgba_at(0, 0)[3] == 0);
            CHECK(out.rgba_at(1, 0)[3] == 255);
        }
    }
}

TEST_CASE("Render: frame fallback and placeholder") {
    const auto pal = test_palette();
    shpkit::memory_surface out;

    SUBCASE("Out of range frame renders frame 0") {
        shpkit::sprite spr(1, 1, 2);
        shpkit::set_pixel(spr, 0, 0, 0, 1);
        shpkit::set_pixel(spr, 1, 0, 0, 2);
        REQUIRE(shpkit::render_frame(spr, pal, 9, out));
        CHECK(out.rgba_at(0, 0)[0] == 100);
    }

    SUBCASE("Empty sprite") {
        CHECK_FALSE(shpkit::render_frame(shpkit::sprite{}, pal, 0, out));
        REQUIRE(out.width() == 1);
        REQUIRE(out.height() == 1);
        const std::uint8_t* px = out.rgba_at(0, 0);
        CHECK(px[0] == 0);
        CHECK(px[1] == 0);
        CHECK(px[2] == 0);
        CHECK(px[3] == 255);
    }

    SUBCASE("Above the pixel ceiling") {
        shpkit::sprite spr(10, 10, 1);
        shpkit::render_options options;
        options.max_pixels = 99;
        CHECK_FALSE(shpkit::render_frame(spr, pal, 0, out, options));
        CHECK(out.width() == 1);
        CHECK(out.height() == 1);
    }
}

TEST_CASE("Render: export_frame_png") {
    const auto path = std::filesystem::temp_directory_path() / "shpkit_test_export.png";
    shpkit::sprite spr(3, 2, 2);
    shpkit::set_pixel(spr, 1, 2, 1, 1);
    const auto pal = test_palette();

    SUBCASE("Writes a decodable PNG") {
        REQUIRE(shpkit::export_frame_png(spr, pal, 1, path).ok);

        shpkit::memory_surface image;
        REQUIRE(shpkit::load_image(path, image).ok);
        CHECK(image.width() == 3);
        CHECK(image.height() == 2);
        CHECK(image.rgba_at(0, 0)[3] == 0);
        CHECK(image.rgba_at(2, 1)[0] == 100);
        CHECK(image.rgba_at(2, 1)[3] == 255);
        std::filesystem::remove(path);
    }

    SUBCASE("Frame out of range") {
        auto result = shpkit::export_frame_png(spr, pal, 2, path);
        CHECK(result.error == shpkit::codec_error::invalid_dimensions);
    }
}
