#ifndef SHPKIT_SESSION_HPP_
#define SHPKIT_SESSION_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/history.hpp>
#include <shpkit/palette.hpp>
#include <shpkit/playback.hpp>
#include <shpkit/sprite.hpp>
#include <shpkit/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace shpkit {

// ============================================================================
// Session Options
// ============================================================================

struct session_options {
    std::size_t max_undo_steps = edit_history::DEFAULT_MAX_DEPTH;
    std::uint32_t ms_per_frame = playback::DEFAULT_MS_PER_FRAME;
    std::size_t default_frame_count = 8;
    decode_options decode;
    import_options import;
};

enum class tool {
    pencil,
    eraser,
    line,
    rectangle,
    circle,
    fill
};

[[nodiscard]] SHPKIT_EXPORT const char* to_string(tool t) noexcept;

// ============================================================================
// Editor Session
// ============================================================================

/**
 * Owns everything one editor window works on: the sprite, the active
 * palette, undo history for the active frame, playback and tool state.
 *
 * Every operation updates status() with a one-line description of what
 * happened. Failed loads leave the current sprite, frame and history intact.
 */
class SHPKIT_EXPORT editor_session {
public:
    explicit editor_session(const session_options& options = {});

    // ------------------------------------------------------------------------
    // Documents
    // ------------------------------------------------------------------------

    /**
     * Replace the current sprite with a blank one.
     * @return invalid_dimensions unless width, height and frame_count are positive
     */
    codec_result new_sprite(int width, int height, std::size_t frame_count);
    // Uses session_options::default_frame_count
    codec_result new_sprite(int width, int height);

    codec_result open_sprite(std::span<const std::uint8_t> data);
    codec_result open_sprite(const std::filesystem::path& path);

    /**
     * @return empty_sprite if no sprite is loaded
     */
    codec_result encode_sprite(std::vector<std::uint8_t>& out);
    codec_result save_sprite(const std::filesystem::path& path);

    codec_result open_palette(const std::filesystem::path& path);
    codec_result save_palette(const std::filesystem::path& path);
    void set_palette(const palette& pal);

    /**
     * Write the active frame as a PNG.
     */
    codec_result export_png(const std::filesystem::path& path);

    [[nodiscard]] bool has_sprite() const noexcept { return sprite_.has_value(); }
    [[nodiscard]] const sprite* current_sprite() const noexcept {
        return sprite_ ? &*sprite_ : nullptr;
    }
    [[nodiscard]] const palette& current_palette() const noexcept { return palette_; }
    [[nodiscard]] bool dirty() const noexcept { return dirty_; }
    [[nodiscard]] const std::string& status() const noexcept { return status_; }
    [[nodiscard]] const session_options& options() const noexcept { return options_; }

    // ------------------------------------------------------------------------
    // Frame navigation
    // ------------------------------------------------------------------------

    // Clamped to the last frame. Changing frames starts a fresh history.
    void set_active_frame(std::size_t index);
    void next_frame();
    void previous_frame();
    [[nodiscard]] std::size_t active_frame() const noexcept { return active_frame_; }

    // ------------------------------------------------------------------------
    // Tools and gestures
    // ------------------------------------------------------------------------

    void set_tool(tool t) noexcept { tool_ = t; }
    [[nodiscard]] tool current_tool() const noexcept { return tool_; }

    void set_brush_index(std::uint8_t index) noexcept { brush_index_ = index; }
    [[nodiscard]] std::uint8_t brush_index() const noexcept { return brush_index_; }

    // Clamped to [1, 20]
    void set_brush_size(int size) noexcept;
    [[nodiscard]] int brush_size() const noexcept { return brush_size_; }

    void set_fill_shapes(bool fill) noexcept { fill_shapes_ = fill; }
    [[nodiscard]] bool fill_shapes() const noexcept { return fill_shapes_; }

    /**
     * Start a gesture at canvas coordinates (x, y).
     * Records one history snapshot of the active frame for the whole gesture.
     */
    void press(int x, int y);
    void drag(int x, int y);
    void release(int x, int y);
    [[nodiscard]] bool drawing() const noexcept { return gesture_start_.has_value(); }

    bool undo();
    bool redo();
    [[nodiscard]] const edit_history& history() const noexcept { return history_; }

    // ------------------------------------------------------------------------
    // Image import
    // ------------------------------------------------------------------------

    codec_result import_image(std::span<const std::uint8_t> data);
    codec_result import_image(const std::filesystem::path& path);

    /**
     * Scale the pending import and paste it with its top-left corner at
     * (x, y), quantized to the active palette. The import stays pending.
     */
    codec_result place_import(int x, int y, float scale = 1.0f);
    void cancel_import();
    [[nodiscard]] bool has_pending_import() const noexcept { return !pending_import_.empty(); }
    [[nodiscard]] const memory_surface& pending_import() const noexcept { return pending_import_; }

    // ------------------------------------------------------------------------
    // Playback and display
    // ------------------------------------------------------------------------

    [[nodiscard]] playback& player() noexcept { return playback_; }
    [[nodiscard]] const playback& player() const noexcept { return playback_; }

    /**
     * Advance playback by wall-clock time.
     * @return true if the active frame changed
     */
    bool tick();
    // Same as tick() with an explicit elapsed time
    bool advance(std::uint64_t elapsed_ms);

    void set_brightness(float brightness) noexcept;
    [[nodiscard]] float brightness() const noexcept { return brightness_; }

    /**
     * Render the active frame at the session brightness.
     * @return false if a placeholder was produced
     */
    bool render(surface& out) const;

private:
    bool require_sprite();
    void reset_document(sprite&& spr);
    void change_frame(std::size_t index);
    void stroke(int x, int y);
    void finish_shape(int x, int y);
    frame& active() { return sprite_->frame_at(active_frame_); }

    session_options options_;
    std::optional<sprite> sprite_;
    palette palette_ = palette::grayscale();
    edit_history history_;
    playback playback_;
    std::size_t active_frame_ = 0;

    tool tool_ = tool::pencil;
    std::uint8_t brush_index_ = 1;
    int brush_size_ = 1;
    bool fill_shapes_ = false;
    std::optional<std::pair<int, int>> gesture_start_;

    memory_surface pending_import_;
    float brightness_ = 1.0f;
    bool dirty_ = false;
    std::string status_;
};

} // namespace shpkit

#endif // SHPKIT_SESSION_HPP_
