#include <shpkit/raster.hpp>
#include <shpkit/quantize.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>
#include <vector>

namespace shpkit {

namespace {

std::uint8_t* pixel_ptr(sprite& spr, std::size_t frame_index, int x, int y) noexcept {
    if (frame_index >= spr.frame_count() || !spr.contains(x, y)) {
        return nullptr;
    }
    auto& pixels = spr.frame_at(frame_index).pixels;
    const std::size_t offset = static_cast<std::size_t>(y) * static_cast<std::size_t>(spr.width()) +
                               static_cast<std::size_t>(x);
    return offset < pixels.size() ? pixels.data() + offset : nullptr;
}

// Fill the inclusive horizontal span [x0, x1] on row y, clipped to the canvas
void fill_span(sprite& spr, std::size_t frame_index, int x0, int x1, int y, std::uint8_t color) noexcept {
    if (y < 0 || y >= spr.height()) {
        return;
    }
    const int lx = std::max(x0, 0);
    const int rx = std::min(x1, spr.width() - 1);
    for (int x = lx; x <= rx; ++x) {
        set_pixel(spr, frame_index, x, y, color);
    }
}

} // namespace

void set_pixel(sprite& spr, std::size_t frame_index, int x, int y, std::uint8_t color) noexcept {
    if (auto* p = pixel_ptr(spr, frame_index, x, y)) {
        *p = color;
    }
}

std::uint8_t get_pixel(const sprite& spr, std::size_t frame_index, int x, int y) noexcept {
    if (frame_index >= spr.frame_count() || !spr.contains(x, y)) {
        return 0;
    }
    const auto pixels = spr.pixels(frame_index);
    const std::size_t offset = static_cast<std::size_t>(y) * static_cast<std::size_t>(spr.width()) +
                               static_cast<std::size_t>(x);
    return offset < pixels.size() ? pixels[offset] : 0;
}

void draw_line(sprite& spr, std::size_t frame_index,
               int x0, int y0, int x1, int y1, std::uint8_t color) noexcept {
    const long long dx = std::llabs(static_cast<long long>(x1) - x0);
    const long long dy = -std::llabs(static_cast<long long>(y1) - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    long long err = dx + dy;

    for (;;) {
        set_pixel(spr, frame_index, x0, y0, color);
        if (x0 == x1 && y0 == y1) {
            break;
        }
        const long long e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

void stamp_disc(sprite& spr, std::size_t frame_index,
                int cx, int cy, int diameter, std::uint8_t color) noexcept {
    if (diameter <= 1) {
        set_pixel(spr, frame_index, cx, cy, color);
        return;
    }
    const int radius = std::max(1, (diameter - 1) / 2);
    fill_circle(spr, frame_index, cx, cy, radius, color);
}

void draw_circle(sprite& spr, std::size_t frame_index,
                 int cx, int cy, int radius, std::uint8_t color) noexcept {
    if (radius <= 0) {
        return;
    }

    int x = radius;
    int y = 0;
    int err = 1 - x;
    while (x >= y) {
        const int points[8][2] = {
            {cx + x, cy + y}, {cx + y, cy + x}, {cx - y, cy + x}, {cx - x, cy + y},
            {cx - x, cy - y}, {cx - y, cy - x}, {cx + y, cy - x}, {cx + x, cy - y},
        };
        for (const auto& pt : points) {
            set_pixel(spr, frame_index, pt[0], pt[1], color);
        }

        ++y;
        if (err < 0) {
            err += 2 * y + 1;
        } else {
            --x;
            err += 2 * (y - x) + 1;
        }
    }
}

void fill_circle(sprite& spr, std::size_t frame_index,
                 int cx, int cy, int radius, std::uint8_t color) noexcept {
    if (radius <= 0) {
        return;
    }

    const long long r2 = static_cast<long long>(radius) * radius;
    const int min_y = std::max(cy - radius, 0);
    const int max_y = std::min(cy + radius, spr.height() - 1);
    for (int y = min_y; y <= max_y; ++y) {
        const long long dy = static_cast<long long>(y) - cy;
        const long long xr2 = r2 - dy * dy;
        if (xr2 < 0) {
            continue;
        }
        // One square root per row
        const int dx = static_cast<int>(std::sqrt(static_cast<double>(xr2)));
        fill_span(spr, frame_index, cx - dx, cx + dx, y, color);
    }
}

void draw_rect(sprite& spr, std::size_t frame_index,
               int x0, int y0, int x1, int y1, std::uint8_t color) noexcept {
    const auto [lx, rx] = std::minmax(x0, x1);
    const auto [ty, by] = std::minmax(y0, y1);
    draw_line(spr, frame_index, lx, ty, rx, ty, color);
    draw_line(spr, frame_index, lx, by, rx, by, color);
    draw_line(spr, frame_index, lx, ty, lx, by, color);
    draw_line(spr, frame_index, rx, ty, rx, by, color);
}

void fill_rect(sprite& spr, std::size_t frame_index,
               int x0, int y0, int x1, int y1, std::uint8_t color) noexcept {
    const auto [lx, rx] = std::minmax(x0, x1);
    const auto [ty, by] = std::minmax(y0, y1);
    const int top = std::max(ty, 0);
    const int bottom = std::min(by, spr.height() - 1);
    for (int y = top; y <= bottom; ++y) {
        fill_span(spr, frame_index, lx, rx, y, color);
    }
}

void flood_fill(sprite& spr, std::size_t frame_index, int x, int y, std::uint8_t new_color) {
    if (frame_index >= spr.frame_count()) {
        return;
    }

    const std::uint8_t target = get_pixel(spr, frame_index, x, y);
    if (target == new_color) {
        return;
    }

    std::vector<std::pair<int, int>> stack;
    stack.emplace_back(x, y);
    while (!stack.empty()) {
        const auto [px, py] = stack.back();
        stack.pop_back();

        if (!spr.contains(px, py)) {
            continue;
        }
        if (get_pixel(spr, frame_index, px, py) != target) {
            continue;
        }
        set_pixel(spr, frame_index, px, py, new_color);

        stack.emplace_back(px - 1, py);
        stack.emplace_back(px + 1, py);
        stack.emplace_back(px, py - 1);
        stack.emplace_back(px, py + 1);
    }
}

void paste_quantized(sprite& spr, std::size_t frame_index,
                     const memory_surface& source,
                     int dest_x, int dest_y,
                     const palette& pal,
                     std::uint8_t alpha_threshold) {
    if (frame_index >= spr.frame_count() || source.empty()) {
        return;
    }

    for (int y = 0; y < source.height(); ++y) {
        const long long ty = static_cast<long long>(y) + dest_y;
        if (ty < 0 || ty >= spr.height()) {
            continue;
        }
        for (int x = 0; x < source.width(); ++x) {
            const long long tx = static_cast<long long>(x) + dest_x;
            if (tx < 0 || tx >= spr.width()) {
                continue;
            }
            const std::uint8_t* px = source.rgba_at(x, y);
            if (!px || px[3] < alpha_threshold) {
                continue;
            }
            const std::uint8_t index = best_index(rgb8{px[0], px[1], px[2]}, pal);
            set_pixel(spr, frame_index, static_cast<int>(tx), static_cast<int>(ty), index);
        }
    }
}

void paste_centered(sprite& spr, std::size_t frame_index,
                    const memory_surface& source,
                    const palette& pal,
                    std::uint8_t alpha_threshold) {
    const int dest_x = (spr.width() - source.width()) / 2;
    const int dest_y = (spr.height() - source.height()) / 2;
    paste_quantized(spr, frame_index, source, dest_x, dest_y, pal, alpha_threshold);
}

} // namespace shpkit
