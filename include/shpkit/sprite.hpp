#ifndef SHPKIT_SPRITE_HPP_
#define SHPKIT_SPRITE_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shpkit {

// ============================================================================
// Frame
// ============================================================================

// Palette index 0 is the background, rendered transparent.
constexpr std::uint8_t BACKGROUND_INDEX = 0;

/**
 * One animation image: width * height palette indices, row-major.
 */
struct frame {
    std::vector<std::uint8_t> pixels;

    friend bool operator==(const frame&, const frame&) = default;
};

// ============================================================================
// Sprite
// ============================================================================

/**
 * Animated indexed sprite: a fixed canvas size and an ordered list of frames.
 * Every frame's buffer holds exactly width * height bytes for the lifetime of
 * the sprite.
 */
class SHPKIT_EXPORT sprite {
public:
    sprite() = default;

    /**
     * Blank canvas with all frames zero-filled.
     * Non-positive dimensions produce an empty sprite.
     */
    sprite(int width, int height, std::size_t frame_count);

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::size_t frame_count() const noexcept { return frames_.size(); }
    [[nodiscard]] std::size_t pixel_count() const noexcept {
        return static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
    }
    [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }

    [[nodiscard]] bool contains(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    [[nodiscard]] const std::vector<frame>& frames() const noexcept { return frames_; }

    // Callers must check index < frame_count()
    [[nodiscard]] frame& frame_at(std::size_t index) noexcept { return frames_[index]; }
    [[nodiscard]] const frame& frame_at(std::size_t index) const noexcept { return frames_[index]; }

    [[nodiscard]] std::span<const std::uint8_t> pixels(std::size_t index) const noexcept {
        return index < frames_.size() ? std::span<const std::uint8_t>(frames_[index].pixels)
                                      : std::span<const std::uint8_t>();
    }

    /**
     * Append a zero-filled frame and return it.
     */
    frame& add_frame();

    friend bool operator==(const sprite&, const sprite&) = default;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<frame> frames_;
};

} // namespace shpkit

#endif // SHPKIT_SPRITE_HPP_
