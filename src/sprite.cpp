#include <shpkit/sprite.hpp>

namespace shpkit {

sprite::sprite(int width, int height, std::size_t frame_count) {
    if (width <= 0 || height <= 0) {
        return;
    }
    width_ = width;
    height_ = height;
    frames_.reserve(frame_count);
    for (std::size_t i = 0; i < frame_count; ++i) {
        add_frame();
    }
}

frame& sprite::add_frame() {
    frames_.push_back(frame{std::vector<std::uint8_t>(pixel_count(), BACKGROUND_INDEX)});
    return frames_.back();
}

} // namespace shpkit
