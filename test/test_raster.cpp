#include <doctest/doctest.h>
#include <shpkit/shpkit.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace {

std::size_t count_color(const shpkit::sprite& spr, std::size_t frame_index, std::uint8_t color) {
    const auto px = spr.pixels(frame_index);
    return static_cast<std::size_t>(std::count(px.begin(), px.end(), color));
}

} // namespace

TEST_CASE("Raster: set_pixel bounds") {
    shpkit::sprite spr(4, 3, 1);
    const auto before = spr.frame_at(0).pixels;

    shpkit::set_pixel(spr, 0, -1, 0, 9);
    shpkit::set_pixel(spr, 0, 4, 0, 9);
    shpkit::set_pixel(spr, 0, 0, -1, 9);
    shpkit::set_pixel(spr, 0, 0, 3, 9);
    shpkit::set_pixel(spr, 5, 0, 0, 9);
    CHECK(spr.frame_at(0).pixels == before);

    shpkit::set_pixel(spr, 0, 3, 2, 9);
    CHECK(shpkit::get_pixel(spr, 0, 3, 2) == 9);
    CHECK(spr.frame_at(0).pixels[2 * 4 + 3] == 9);
    CHECK(shpkit::get_pixel(spr, 0, 99, 99) == 0);
}

TEST_CASE("Raster: draw_line") {
    shpkit::sprite spr(8, 8, 1);

    SUBCASE("Horizontal includes both endpoints") {
        shpkit::draw_line(spr, 0, 1, 2, 5, 2, 4);
        CHECK(count_color(spr, 0, 4) == 5);
        CHECK(shpkit::get_pixel(spr, 0, 1, 2) == 4);
        CHECK(shpkit::get_pixel(spr, 0, 5, 2) == 4);
    }

    SUBCASE("Diagonal") {
        shpkit::draw_line(spr, 0, 7, 7, 0, 0, 4);
        for (int i = 0; i < 8; ++i) {
            CHECK(shpkit::get_pixel(spr, 0, i, i) == 4);
        }
        CHECK(count_color(spr, 0, 4) == 8);
    }

    SUBCASE("Single point") {
        shpkit::draw_line(spr, 0, 3, 3, 3, 3, 4);
        CHECK(count_color(spr, 0, 4) == 1);
    }

    SUBCASE("Clipped at the canvas edge") {
        shpkit::draw_line(spr, 0, -5, 0, 20, 0, 4);
        CHECK(count_color(spr, 0, 4) == 8);
    }
}

TEST_CASE("Raster: rectangles") {
    shpkit::sprite spr(10, 10, 1);

    SUBCASE("Outline with swapped corners") {
        shpkit::draw_rect(spr, 0, 6, 5, 2, 1, 3);
        CHECK(count_color(spr, 0, 3) == 2 * 5 + 2 * 3);
        CHECK(shpkit::get_pixel(spr, 0, 2, 1) == 3);
        CHECK(shpkit::get_pixel(spr, 0, 6, 5) == 3);
        CHECK(shpkit::get_pixel(spr, 0, 4, 3) == 0);
    }

    SUBCASE("Filled and clipped") {
        shpkit::fill_rect(spr, 0, -3, -3, 1, 1, 3);
        CHECK(count_color(spr, 0, 3) == 4);
    }
}

TEST_CASE("Raster: circles") {
    shpkit::sprite spr(21, 21, 1);

    SUBCASE("Filled disc") {
        shpkit::fill_circle(spr, 0, 10, 10, 3, 5);
        for (int y = 0; y < 21; ++y) {
            for (int x = 0; x < 21; ++x) {
                const int d2 = (x - 10) * (x - 10) + (y - 10) * (y - 10);
                CAPTURE(x);
                CAPTURE(y);
                CHECK((shpkit::get_pixel(spr, 0, x, y) == 5) == (d2 <= 9));
            }
        }
    }

    SUBCASE("Outline touches the four extremes") {
        shpkit::draw_circle(spr, 0, 10, 10, 5, 5);
        CHECK(shpkit::get_pixel(spr, 0, 15, 10) == 5);
        CHECK(shpkit::get_pixel(spr, 0, 5, 10) == 5);
        CHECK(shpkit::get_pixel(spr, 0, 10, 15) == 5);
        CHECK(shpkit::get_pixel(spr, 0, 10, 5) == 5);
        CHECK(shpkit::get_pixel(spr, 0, 10, 10) == 0);
    }

    SUBCASE("Radius zero draws nothing") {
        shpkit::draw_circle(spr, 0, 10, 10, 0, 5);
        shpkit::fill_circle(spr, 0, 10, 10, 0, 5);
        CHECK(count_color(spr, 0, 5) == 0);
    }

    SUBCASE("Brush stamp") {
        shpkit::stamp_disc(spr, 0, 10, 10, 1, 5);
        CHECK(count_color(spr, 0, 5) == 1);

        shpkit::stamp_disc(spr, 0, 3, 3, 3, 6);
        // radius 1: centre plus four neighbours
        CHECK(count_color(spr, 0, 6) == 5);
    }
}

TEST_CASE("Raster: flood_fill") {
    shpkit::sprite spr(10, 10, 1);
    shpkit::draw_rect(spr, 0, 2, 2, 7, 7, 1);

    SUBCASE("Fills the enclosed region only") {
        shpkit::flood_fill(spr, 0, 4, 4, 2);
        CHECK(count_color(spr, 0, 2) == 4 * 4);
        CHECK(shpkit::get_pixel(spr, 0, 0, 0) == 0);
    }

    SUBCASE("Idempotent") {
        shpkit::flood_fill(spr, 0, 0, 0, 3);
        const auto once = spr.frame_at(0).pixels;
        shpkit::flood_fill(spr, 0, 0, 0, 3);
        CHECK(spr.frame_at(0).pixels == once);
    }

    SUBCASE("Large canvas does not recurse") {
        shpkit::sprite big(1024, 1024, 1);
        shpkit::flood_fill(big, 0, 512, 512, 7);
        CHECK(count_color(big, 0, 7) == 1024u * 1024u);
    }

    SUBCASE("Seed outside the canvas") {
        const auto before = spr.frame_at(0).pixels;
        shpkit::flood_fill(spr, 0, -1, 4, 9);
        CHECK(spr.frame_at(0).pixels == before);
    }
}

TEST_CASE("Raster: paste_quantized") {
    const auto pal = shpkit::palette::grayscale();

    shpkit::memory_surface src;
    REQUIRE(src.set_size(2, 2));
    const std::uint8_t row0[] = {10, 10, 10, 255, 20, 20, 20, 7};
    const std::uint8_t row1[] = {30, 30, 30, 8, 40, 40, 40, 128};
    src.write_row(0, row0);
    src.write_row(1, row1);

    SUBCASE("Alpha threshold and translation") {
        shpkit::sprite spr(4, 4, 1);
        shpkit::set_pixel(spr, 0, 2, 1, 99);
        shpkit::paste_quantized(spr, 0, src, 1, 1, pal);
        CHECK(shpkit::get_pixel(spr, 0, 1, 1) == 10);
        CHECK(shpkit::get_pixel(spr, 0, 2, 1) == 99);
        CHECK(shpkit::get_pixel(spr, 0, 1, 2) == 30);
        CHECK(shpkit::get_pixel(spr, 0, 2, 2) == 40);
    }

    SUBCASE("Clipped at negative offsets") {
        shpkit::sprite spr(2, 2, 1);
        shpkit::paste_quantized(spr, 0, src, -1, -1, pal);
        CHECK(shpkit::get_pixel(spr, 0, 0, 0) == 40);
        CHECK(count_color(spr, 0, 0) == 3);
    }

    SUBCASE("Centred") {
        shpkit::sprite spr(4, 4, 1);
        shpkit::paste_centered(spr, 0, src, pal);
        CHECK(shpkit::get_pixel(spr, 0, 1, 1) == 10);
        CHECK(shpkit::get_pixel(spr, 0, 2, 2) == 40);
    }
}
