#include <shpkit/surface.hpp>

#include <algorithm>
#include <new>
#include <utility>

namespace shpkit {

namespace {

// 0 when the buffer would overflow or exceed MAX_SURFACE_BYTES
std::size_t buffer_size(int width, int height) noexcept {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    const auto w = static_cast<std::size_t>(width);
    const auto h = static_cast<std::size_t>(height);
    if (w > MAX_SURFACE_BYTES / RGBA_BYTES / h) {
        return 0;
    }
    return w * h * RGBA_BYTES;
}

} // namespace

bool memory_surface::set_size(int width, int height) {
    const std::size_t size = buffer_size(width, height);
    if (size == 0) {
        return false;
    }

    std::vector<std::uint8_t> pixels;
    try {
        pixels.assign(size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    pixels_ = std::move(pixels);
    width_ = width;
    height_ = height;
    return true;
}

void memory_surface::write_row(int y, std::span<const std::uint8_t> rgba) {
    if (y < 0 || y >= height_) {
        return;
    }
    const std::size_t stride = row_bytes();
    const std::size_t count = std::min(rgba.size(), stride);
    std::copy_n(rgba.begin(), count,
                pixels_.begin() + static_cast<std::ptrdiff_t>(static_cast<std::size_t>(y) * stride));
}

std::span<const std::uint8_t> memory_surface::row(int y) const noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    const std::size_t stride = row_bytes();
    return std::span<const std::uint8_t>(pixels_).subspan(static_cast<std::size_t>(y) * stride, stride);
}

const std::uint8_t* memory_surface::rgba_at(int x, int y) const noexcept {
    if (x < 0 || x >= width_) {
        return nullptr;
    }
    const auto r = row(y);
    return r.empty() ? nullptr : r.data() + static_cast<std::size_t>(x) * RGBA_BYTES;
}

} // namespace shpkit
