#ifndef SHPKIT_SURFACE_HPP_
#define SHPKIT_SURFACE_HPP_

#include <shpkit/shpkit_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shpkit {

// ============================================================================
// RGBA Surface
// ============================================================================
//
// True-color pixels are always 8-bit RGBA, row-major, rows packed without
// padding. Imported images arrive in this layout and rendered frames leave
// in it.

constexpr std::size_t RGBA_BYTES = 4;

// Largest pixel buffer a surface will allocate
constexpr std::size_t MAX_SURFACE_BYTES = 1024ULL * 1024ULL * 1024ULL;

/**
 * Destination for decoded or rendered RGBA pixels.
 * Implement this to decode or render straight into a texture or bitmap type.
 */
class SHPKIT_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Allocate width x height pixels, all (0, 0, 0, 0).
     * Called once before any row is written.
     * @return false for non-positive dimensions or if allocation fails
     */
    virtual bool set_size(int width, int height) = 0;

    /**
     * Copy one row of RGBA bytes, starting at the left edge.
     * Bytes past the row width and rows outside the surface are dropped.
     */
    virtual void write_row(int y, std::span<const std::uint8_t> rgba) = 0;
};

// ============================================================================
// Memory Surface
// ============================================================================

class SHPKIT_EXPORT memory_surface final : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    bool set_size(int width, int height) override;
    void write_row(int y, std::span<const std::uint8_t> rgba) override;

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::size_t row_bytes() const noexcept {
        return static_cast<std::size_t>(width_) * RGBA_BYTES;
    }

    // Whole image, height() * row_bytes() bytes
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }

    // Empty span for rows outside the surface
    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept;

    /**
     * Pointer to the 4 bytes of pixel (x, y), or nullptr when out of bounds.
     */
    [[nodiscard]] const std::uint8_t* rgba_at(int x, int y) const noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
};

} // namespace shpkit

#endif // SHPKIT_SURFACE_HPP_
