#include <shpkit/session.hpp>
#include <shpkit/file_io.hpp>
#include <shpkit/import.hpp>
#include <shpkit/raster.hpp>
#include <shpkit/render.hpp>
#include <shpkit/codecs/shp.hpp>

#include <algorithm>
#include <cmath>
#include <new>

namespace shpkit {

namespace {

constexpr int MIN_BRUSH_SIZE = 1;
constexpr int MAX_BRUSH_SIZE = 20;

std::string describe(const codec_result& result) {
    return result.message.empty() ? std::string(to_string(result.error)) : result.message;
}

} // namespace

const char* to_string(tool t) noexcept {
    switch (t) {
        case tool::pencil:    return "pencil";
        case tool::eraser:    return "eraser";
        case tool::line:      return "line";
        case tool::rectangle: return "rectangle";
        case tool::circle:    return "circle";
        case tool::fill:      return "fill";
    }
    return "unknown";
}

editor_session::editor_session(const session_options& options)
    : options_(options),
      history_(options.max_undo_steps),
      playback_(options.ms_per_frame) {}

bool editor_session::require_sprite() {
    if (!sprite_) {
        status_ = "No sprite loaded";
        return false;
    }
    return true;
}

void editor_session::reset_document(sprite&& spr) {
    sprite_ = std::move(spr);
    active_frame_ = 0;
    history_.reset(0);
    playback_.set_current_frame(0);
    playback_.pause();
    gesture_start_.reset();
    pending_import_ = memory_surface{};
    dirty_ = false;
}

void editor_session::change_frame(std::size_t index) {
    active_frame_ = index;
    history_.reset(index);
    playback_.set_current_frame(index);
    gesture_start_.reset();
}

// ============================================================================
// Documents
// ============================================================================

codec_result editor_session::new_sprite(int width, int height, std::size_t frame_count) {
    if (width <= 0 || height <= 0 || frame_count == 0) {
        status_ = "Width, height and frame count must be positive";
        return codec_result::failure(codec_error::invalid_dimensions, status_);
    }

    if (static_cast<std::size_t>(width) > SHP_MAX_DIMENSION ||
        static_cast<std::size_t>(height) > SHP_MAX_DIMENSION ||
        frame_count > SHP_MAX_FRAMES) {
        status_ = "Sprite exceeds SHP limits (65535 pixels per side, 65535 frames)";
        return codec_result::failure(codec_error::invalid_dimensions, status_);
    }

    const std::size_t canvas = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    if (canvas > options_.decode.max_canvas_bytes / frame_count) {
        status_ = "Sprite size exceeds the canvas limit";
        return codec_result::failure(codec_error::invalid_dimensions, status_);
    }

    try {
        reset_document(sprite(width, height, frame_count));
    } catch (const std::bad_alloc&) {
        status_ = "Failed to allocate sprite frames";
        return codec_result::failure(codec_error::internal_error, status_);
    }
    status_ = "Created sprite " + std::to_string(width) + "x" + std::to_string(height) +
              ", " + std::to_string(frame_count) + " frames";
    return codec_result::success();
}

codec_result editor_session::new_sprite(int width, int height) {
    return new_sprite(width, height, options_.default_frame_count);
}

codec_result editor_session::open_sprite(std::span<const std::uint8_t> data) {
    sprite decoded;
    auto result = shp_decoder::decode(data, decoded, options_.decode);
    if (!result) {
        status_ = "Failed to load sprite: " + describe(result);
        return result;
    }

    const auto frames = decoded.frame_count();
    reset_document(std::move(decoded));
    status_ = "Loaded sprite " + std::to_string(sprite_->width()) + "x" +
              std::to_string(sprite_->height()) + ", " + std::to_string(frames) + " frames";
    return result;
}

codec_result editor_session::open_sprite(const std::filesystem::path& path) {
    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) {
        status_ = "Failed to read file: " + describe(result);
        return result;
    }
    result = open_sprite(data);
    if (result) {
        status_ = "Loaded sprite: " + path.string();
    }
    return result;
}

codec_result editor_session::encode_sprite(std::vector<std::uint8_t>& out) {
    if (!require_sprite()) {
        return codec_result::failure(codec_error::empty_sprite, status_);
    }
    auto result = encode_shp(*sprite_, out);
    if (!result) {
        status_ = "Failed to encode sprite: " + describe(result);
    }
    return result;
}

codec_result editor_session::save_sprite(const std::filesystem::path& path) {
    std::vector<std::uint8_t> data;
    auto result = encode_sprite(data);
    if (!result) {
        return result;
    }
    result = write_file(path, data);
    if (!result) {
        status_ = "Save failed: " + describe(result);
        return result;
    }
    dirty_ = false;
    status_ = "Saved: " + path.string();
    return result;
}

codec_result editor_session::open_palette(const std::filesystem::path& path) {
    palette loaded;
    auto result = load_palette(path, loaded);
    if (!result) {
        status_ = "Failed to load palette: " + describe(result);
        return result;
    }
    set_palette(loaded);
    status_ = "Loaded palette: " + path.string();
    return result;
}

codec_result editor_session::save_palette(const std::filesystem::path& path) {
    auto result = shpkit::save_palette(palette_, path);
    status_ = result ? "Saved palette: " + path.string()
                     : "Failed to save palette: " + describe(result);
    return result;
}

void editor_session::set_palette(const palette& pal) {
    palette_ = pal;
    // The palette changes how the sprite looks, so treat it as an edit
    if (sprite_) {
        dirty_ = true;
    }
    status_ = "Palette changed";
}

codec_result editor_session::export_png(const std::filesystem::path& path) {
    if (!require_sprite()) {
        return codec_result::failure(codec_error::empty_sprite, status_);
    }
    auto result = export_frame_png(*sprite_, palette_, active_frame_, path);
    status_ = result ? "Exported: " + path.string() : "Export failed: " + describe(result);
    return result;
}

// ============================================================================
// Frame Navigation
// ============================================================================

void editor_session::set_active_frame(std::size_t index) {
    if (!sprite_ || sprite_->empty()) {
        return;
    }
    index = std::min(index, sprite_->frame_count() - 1);
    if (index != active_frame_) {
        change_frame(index);
    }
    status_ = "Frame " + std::to_string(active_frame_ + 1) + "/" +
              std::to_string(sprite_->frame_count());
}

void editor_session::next_frame() {
    set_active_frame(active_frame_ + 1);
}

void editor_session::previous_frame() {
    set_active_frame(active_frame_ > 0 ? active_frame_ - 1 : 0);
}

// ============================================================================
// Tools and Gestures
// ============================================================================

void editor_session::set_brush_size(int size) noexcept {
    brush_size_ = std::clamp(size, MIN_BRUSH_SIZE, MAX_BRUSH_SIZE);
}

void editor_session::stroke(int x, int y) {
    const std::uint8_t color = tool_ == tool::eraser ? BACKGROUND_INDEX : brush_index_;
    stamp_disc(*sprite_, active_frame_, x, y, brush_size_, color);
}

void editor_session::finish_shape(int x, int y) {
    const auto [x0, y0] = *gesture_start_;
    switch (tool_) {
        case tool::line:
            draw_line(*sprite_, active_frame_, x0, y0, x, y, brush_index_);
            break;
        case tool::rectangle:
            if (fill_shapes_) {
                fill_rect(*sprite_, active_frame_, x0, y0, x, y, brush_index_);
            } else {
                draw_rect(*sprite_, active_frame_, x0, y0, x, y, brush_index_);
            }
            break;
        case tool::circle: {
            const double dx = static_cast<double>(x) - x0;
            const double dy = static_cast<double>(y) - y0;
            const int radius = static_cast<int>(std::sqrt(dx * dx + dy * dy));
            if (fill_shapes_) {
                fill_circle(*sprite_, active_frame_, x0, y0, radius, brush_index_);
            } else {
                draw_circle(*sprite_, active_frame_, x0, y0, radius, brush_index_);
            }
            break;
        }
        case tool::pencil:
        case tool::eraser:
        case tool::fill:
            break;
    }
}

void editor_session::press(int x, int y) {
    if (!sprite_ || gesture_start_ || active_frame_ >= sprite_->frame_count()) {
        return;
    }
    if (!sprite_->contains(x, y)) {
        return;
    }

    history_.record(active(), active_frame_);
    dirty_ = true;

    switch (tool_) {
        case tool::pencil:
        case tool::eraser:
            stroke(x, y);
            gesture_start_.emplace(x, y);
            break;
        case tool::fill:
            flood_fill(*sprite_, active_frame_, x, y, brush_index_);
            break;
        case tool::line:
        case tool::rectangle:
        case tool::circle:
            gesture_start_.emplace(x, y);
            break;
    }
}

void editor_session::drag(int x, int y) {
    if (!sprite_ || !gesture_start_) {
        return;
    }
    if (tool_ == tool::pencil || tool_ == tool::eraser) {
        stroke(x, y);
    }
}

void editor_session::release(int x, int y) {
    if (!sprite_ || !gesture_start_) {
        return;
    }
    finish_shape(x, y);
    gesture_start_.reset();
}

bool editor_session::undo() {
    if (!sprite_ || active_frame_ >= sprite_->frame_count()) {
        return false;
    }
    const auto anchor = history_.anchor();
    if (history_.undo(active(), active_frame_)) {
        dirty_ = true;
        status_ = "Undone";
        return true;
    }
    status_ = anchor && *anchor != active_frame_ ? "Frame changed, history cleared"
                                                  : "Nothing to undo";
    return false;
}

bool editor_session::redo() {
    if (!sprite_ || active_frame_ >= sprite_->frame_count()) {
        return false;
    }
    const auto anchor = history_.anchor();
    if (history_.redo(active(), active_frame_)) {
        dirty_ = true;
        status_ = "Redone";
        return true;
    }
    status_ = anchor && *anchor != active_frame_ ? "Frame changed, history cleared"
                                                  : "Nothing to redo";
    return false;
}

// ============================================================================
// Image Import
// ============================================================================

codec_result editor_session::import_image(std::span<const std::uint8_t> data) {
    if (!require_sprite()) {
        status_ = "Create or open a sprite first";
        return codec_result::failure(codec_error::empty_sprite, status_);
    }

    memory_surface decoded;
    auto result = decode_image(data, decoded, options_.import);
    if (!result) {
        status_ = "Import failed: " + describe(result);
        return result;
    }
    pending_import_ = std::move(decoded);
    status_ = "Image loaded (" + std::to_string(pending_import_.width()) + "x" +
              std::to_string(pending_import_.height()) + "), ready to place";
    return result;
}

codec_result editor_session::import_image(const std::filesystem::path& path) {
    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) {
        status_ = "Import failed: " + describe(result);
        return result;
    }
    return import_image(data);
}

codec_result editor_session::place_import(int x, int y, float scale) {
    if (!require_sprite()) {
        return codec_result::failure(codec_error::empty_sprite, status_);
    }
    if (pending_import_.empty()) {
        status_ = "No image to place";
        return codec_result::failure(codec_error::invalid_format, status_);
    }

    memory_surface scaled;
    auto result = scale_nearest(pending_import_, scale, scaled, options_.import.max_scaled_side);
    if (!result) {
        status_ = "Import failed: " + describe(result);
        return result;
    }

    history_.record(active(), active_frame_);
    paste_quantized(*sprite_, active_frame_, scaled, x, y, palette_, options_.import.alpha_threshold);
    dirty_ = true;
    status_ = "Placed image at (" + std::to_string(x) + ", " + std::to_string(y) + ")";
    return result;
}

void editor_session::cancel_import() {
    pending_import_ = memory_surface{};
    status_ = "Import cancelled";
}

// ============================================================================
// Playback and Display
// ============================================================================

bool editor_session::tick() {
    if (!sprite_) {
        return false;
    }
    const auto next = playback_.tick(sprite_->frame_count());
    if (!next || *next == active_frame_) {
        return false;
    }
    change_frame(*next);
    return true;
}

bool editor_session::advance(std::uint64_t elapsed_ms) {
    if (!sprite_) {
        return false;
    }
    const auto next = playback_.advance(elapsed_ms, sprite_->frame_count());
    if (!next || *next == active_frame_) {
        return false;
    }
    change_frame(*next);
    return true;
}

void editor_session::set_brightness(float brightness) noexcept {
    brightness_ = std::clamp(brightness, MIN_BRIGHTNESS, MAX_BRIGHTNESS);
}

bool editor_session::render(surface& out) const {
    render_options options;
    options.brightness = brightness_;
    if (!sprite_) {
        return render_frame(sprite{}, palette_, 0, out, options);
    }
    return render_frame(*sprite_, palette_, active_frame_, out, options);
}

} // namespace shpkit
