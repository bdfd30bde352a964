#include <doctest/doctest.h>
#include <shpkit/shpkit.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace {

std::vector<std::uint8_t> solid_png(int width, int height, std::uint8_t gray, std::uint8_t alpha) {
    shpkit::memory_surface surf;
    REQUIRE(surf.set_size(width, height));
    std::vector<std::uint8_t> row(static_cast<std::size_t>(width) * 4);
    for (std::size_t i = 0; i < row.size(); i += 4) {
        row[i + 0] = gray;
        row[i + 1] = gray;
        row[i + 2] = gray;
        row[i + 3] = alpha;
    }
    for (int y = 0; y < height; ++y) {
        surf.write_row(y, row);
    }
    std::vector<std::uint8_t> png;
    REQUIRE(shpkit::encode_png(surf, png).ok);
    return png;
}

std::uint8_t pixel(const shpkit::editor_session& session, std::size_t frame_index, int x, int y) {
    return shpkit::get_pixel(*session.current_sprite(), frame_index, x, y);
}

} // namespace

TEST_CASE("Session: new sprite") {
    shpkit::editor_session session;
    CHECK_FALSE(session.has_sprite());

    SUBCASE("Valid dimensions") {
        REQUIRE(session.new_sprite(16, 8, 4).ok);
        REQUIRE(session.has_sprite());
        CHECK(session.current_sprite()->width() == 16);
        CHECK(session.current_sprite()->frame_count() == 4);
        CHECK(session.active_frame() == 0);
        CHECK_FALSE(session.dirty());
        CHECK_FALSE(session.status().empty());
        CHECK(*session.history().anchor() == 0);
    }

    SUBCASE("Default frame count") {
        shpkit::session_options options;
        options.default_frame_count = 3;
        shpkit::editor_session configured(options);
        REQUIRE(configured.new_sprite(4, 4).ok);
        CHECK(configured.current_sprite()->frame_count() == 3);
    }

    SUBCASE("Invalid dimensions") {
        CHECK(session.new_sprite(0, 8, 4).error == shpkit::codec_error::invalid_dimensions);
        CHECK(session.new_sprite(8, 8, 0).error == shpkit::codec_error::invalid_dimensions);
        CHECK_FALSE(session.has_sprite());
    }

    SUBCASE("Side longer than 65535") {
        CHECK(session.new_sprite(65536, 1, 1).error == shpkit::codec_error::invalid_dimensions);
        CHECK(session.new_sprite(1, 65536, 1).error == shpkit::codec_error::invalid_dimensions);
        CHECK_FALSE(session.has_sprite());
    }

    SUBCASE("More than 65535 frames") {
        CHECK(session.new_sprite(1, 1, 65536).error == shpkit::codec_error::invalid_dimensions);
        CHECK_FALSE(session.has_sprite());
    }

    SUBCASE("Canvas over the configured limit") {
        shpkit::session_options options;
        options.decode.max_canvas_bytes = 100;
        shpkit::editor_session limited(options);
        REQUIRE(limited.new_sprite(10, 5, 2).ok);

        CHECK(limited.new_sprite(10, 10, 2).error == shpkit::codec_error::invalid_dimensions);
        REQUIRE(limited.has_sprite());
        CHECK(limited.current_sprite()->height() == 5);
    }

    SUBCASE("Stops playback") {
        REQUIRE(session.new_sprite(2, 2, 3).ok);
        session.player().play();
        REQUIRE(session.new_sprite(2, 2, 3).ok);
        CHECK_FALSE(session.player().playing());
        CHECK_FALSE(session.advance(1000));
    }
}

TEST_CASE("Session: drawing gestures") {
    shpkit::editor_session session;
    REQUIRE(session.new_sprite(20, 20, 2).ok);
    session.set_brush_index(7);

    SUBCASE("Pencil stroke is one undo step") {
        session.set_tool(shpkit::tool::pencil);
        session.press(1, 1);
        session.drag(2, 1);
        session.drag(3, 1);
        session.release(3, 1);
        CHECK(pixel(session, 0, 1, 1) == 7);
        CHECK(pixel(session, 0, 3, 1) == 7);
        CHECK(session.dirty());
        CHECK(session.history().undo_depth() == 1);

        REQUIRE(session.undo());
        CHECK(pixel(session, 0, 1, 1) == 0);
        CHECK(pixel(session, 0, 3, 1) == 0);
        REQUIRE(session.redo());
        CHECK(pixel(session, 0, 3, 1) == 7);
    }

    SUBCASE("Eraser paints the background") {
        session.press(5, 5);
        session.release(5, 5);
        session.set_tool(shpkit::tool::eraser);
        session.press(5, 5);
        session.release(5, 5);
        CHECK(pixel(session, 0, 5, 5) == 0);
    }

    SUBCASE("Line is drawn on release") {
        session.set_tool(shpkit::tool::line);
        session.press(0, 0);
        session.drag(5, 0);
        CHECK(pixel(session, 0, 5, 0) == 0);
        session.release(5, 0);
        CHECK(pixel(session, 0, 5, 0) == 7);
        CHECK(pixel(session, 0, 3, 0) == 7);
        CHECK_FALSE(session.drawing());
    }

    SUBCASE("Filled rectangle") {
        session.set_tool(shpkit::tool::rectangle);
        session.set_fill_shapes(true);
        session.press(2, 2);
        session.release(4, 4);
        CHECK(pixel(session, 0, 3, 3) == 7);
    }

    SUBCASE("Circle radius from the drag distance") {
        session.set_tool(shpkit::tool::circle);
        session.press(10, 10);
        session.release(13, 14);
        CHECK(pixel(session, 0, 15, 10) == 7);
        CHECK(pixel(session, 0, 10, 10) == 0);
    }

    SUBCASE("Fill completes on press") {
        session.set_tool(shpkit::tool::fill);
        session.press(0, 0);
        CHECK_FALSE(session.drawing());
        CHECK(pixel(session, 0, 19, 19) == 7);
        CHECK(pixel(session, 1, 19, 19) == 0);
    }

    SUBCASE("Press outside the canvas is ignored") {
        session.press(-1, 3);
        CHECK_FALSE(session.drawing());
        CHECK_FALSE(session.history().can_undo());
    }

    SUBCASE("Brush size is clamped") {
        session.set_brush_size(0);
        CHECK(session.brush_size() == 1);
        session.set_brush_size(99);
        CHECK(session.brush_size() == 20);
    }
}

TEST_CASE("Session: frame navigation resets history") {
    shpkit::editor_session session;
    REQUIRE(session.new_sprite(4, 4, 3).ok);

    session.press(0, 0);
    session.release(0, 0);
    CHECK(session.history().can_undo());

    session.next_frame();
    CHECK(session.active_frame() == 1);
    CHECK_FALSE(session.history().can_undo());
    CHECK_FALSE(session.undo());
    CHECK(pixel(session, 0, 0, 0) == 1);

    session.set_active_frame(99);
    CHECK(session.active_frame() == 2);
    session.next_frame();
    CHECK(session.active_frame() == 2);

    session.set_active_frame(0);
    session.previous_frame();
    CHECK(session.active_frame() == 0);
}

TEST_CASE("Session: open and save") {
    const auto path = std::filesystem::temp_directory_path() / "shpkit_test_session.shp";
    shpkit::editor_session session;

    SUBCASE("Encode without a sprite") {
        std::vector<std::uint8_t> data;
        CHECK(session.encode_sprite(data).error == shpkit::codec_error::empty_sprite);
        CHECK(session.save_sprite(path).error == shpkit::codec_error::empty_sprite);
    }

    SUBCASE("Save clears the dirty flag and reopens identically") {
        REQUIRE(session.new_sprite(6, 5, 2).ok);
        session.press(2, 2);
        session.release(2, 2);
        CHECK(session.dirty());
        REQUIRE(session.save_sprite(path).ok);
        CHECK_FALSE(session.dirty());

        shpkit::editor_session other;
        REQUIRE(other.open_sprite(path).ok);
        CHECK(*other.current_sprite() == *session.current_sprite());
        std::filesystem::remove(path);
    }

    SUBCASE("Failed open keeps the current state") {
        REQUIRE(session.new_sprite(4, 4, 2).ok);
        session.set_active_frame(1);
        session.press(1, 1);
        session.release(1, 1);
        const shpkit::sprite before = *session.current_sprite();

        std::vector<std::uint8_t> garbage = {1, 2, 3, 4, 5, 6, 7, 8, 9};
        auto result = session.open_sprite(std::span<const std::uint8_t>(garbage));
        CHECK(result.error == shpkit::codec_error::not_a_sprite);
        CHECK(*session.current_sprite() == before);
        CHECK(session.active_frame() == 1);
        CHECK(session.history().can_undo());
    }
}

TEST_CASE("Session: palettes") {
    const auto path = std::filesystem::temp_directory_path() / "shpkit_test_session.pal";
    shpkit::editor_session session;
    CHECK(session.current_palette() == shpkit::palette::grayscale());

    shpkit::palette pal;
    pal[1] = {255, 0, 0};
    session.set_palette(pal);
    REQUIRE(session.save_palette(path).ok);

    session.set_palette(shpkit::palette::grayscale());
    REQUIRE(session.open_palette(path).ok);
    CHECK(session.current_palette() == pal);
    std::filesystem::remove(path);

    CHECK(session.open_palette(path).error == shpkit::codec_error::io_error);
    CHECK(session.current_palette() == pal);
}

TEST_CASE("Session: image import") {
    shpkit::editor_session session;

    SUBCASE("Requires a sprite") {
        CHECK_FALSE(session.import_image(solid_png(2, 2, 90, 255)).ok);
    }

    SUBCASE("Place quantizes with the active palette") {
        REQUIRE(session.new_sprite(8, 8, 1).ok);
        REQUIRE(session.import_image(solid_png(2, 2, 90, 255)).ok);
        REQUIRE(session.has_pending_import());

        REQUIRE(session.place_import(3, 3, 2.0f).ok);
        CHECK(pixel(session, 0, 3, 3) == 90);
        CHECK(pixel(session, 0, 6, 6) == 90);
        CHECK(pixel(session, 0, 7, 7) == 0);
        CHECK(session.history().can_undo());

        REQUIRE(session.undo());
        CHECK(pixel(session, 0, 3, 3) == 0);

        session.cancel_import();
        CHECK_FALSE(session.has_pending_import());
        CHECK_FALSE(session.place_import(0, 0).ok);
    }

    SUBCASE("Transparent pixels leave the frame untouched") {
        REQUIRE(session.new_sprite(4, 4, 1).ok);
        REQUIRE(session.import_image(solid_png(4, 4, 200, 0)).ok);
        REQUIRE(session.place_import(0, 0).ok);
        const auto px = session.current_sprite()->pixels(0);
        CHECK(std::all_of(px.begin(), px.end(), [](std::uint8_t v) { return v == 0; }));
    }

    SUBCASE("Unknown data") {
        REQUIRE(session.new_sprite(4, 4, 1).ok);
        std::vector<std::uint8_t> data = {1, 2, 3};
        CHECK(session.import_image(std::span<const std::uint8_t>(data)).error ==
              shpkit::codec_error::invalid_format);
    }
}

TEST_CASE("Session: playback") {
    shpkit::editor_session session;
    REQUIRE(session.new_sprite(2, 2, 3).ok);

    CHECK_FALSE(session.advance(1000));

    session.player().play();
    session.press(0, 0);
    session.release(0, 0);
    REQUIRE(session.advance(150));
    CHECK(session.active_frame() == 1);
    CHECK_FALSE(session.history().can_undo());
    CHECK(*session.history().anchor() == 1);

    REQUIRE(session.advance(300));
    CHECK(session.active_frame() == 0);
}

TEST_CASE("Session: render") {
    shpkit::editor_session session;
    shpkit::memory_surface out;

    CHECK_FALSE(session.render(out));
    CHECK(out.width() == 1);

    REQUIRE(session.new_sprite(3, 3, 1).ok);
    session.set_brush_index(100);
    session.press(1, 1);
    session.release(1, 1);
    session.set_brightness(2.0f);
    REQUIRE(session.render(out));
    CHECK(out.width() == 3);
    CHECK(out.rgba_at(1, 1)[0] == 200);
    CHECK(out.rgba_at(1, 1)[3] == 255);
    CHECK(out.rgba_at(0, 0)[3] == 0);

    session.set_brightness(10.0f);
    CHECK(session.brightness() == doctest::Approx(3.0f));
}
