#ifndef SHPKIT_PLAYBACK_HPP_
#define SHPKIT_PLAYBACK_HPP_

#include <shpkit/shpkit_export.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace shpkit {

// ============================================================================
// Animation Playback
// ============================================================================

/**
 * Frame-rate accumulator. Elapsed time is accumulated and whole frame
 * intervals are consumed from it; the remainder carries over to the next
 * call, so irregular polling does not change the playback speed.
 */
class SHPKIT_EXPORT playback {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::uint32_t DEFAULT_MS_PER_FRAME = 150;

    explicit playback(std::uint32_t ms_per_frame = DEFAULT_MS_PER_FRAME) noexcept;

    /**
     * Add elapsed time and advance, wrapping at frame_count.
     * @return the new frame index if at least one step happened
     */
    std::optional<std::size_t> advance(std::uint64_t elapsed_ms, std::size_t frame_count) noexcept;

    /**
     * advance() with the time elapsed since the previous tick (or play()).
     */
    std::optional<std::size_t> tick(std::size_t frame_count) noexcept;

    void play() noexcept;
    void pause() noexcept { playing_ = false; }
    [[nodiscard]] bool playing() const noexcept { return playing_; }

    [[nodiscard]] std::size_t current_frame() const noexcept { return current_frame_; }
    void set_current_frame(std::size_t index) noexcept { current_frame_ = index; }

    [[nodiscard]] std::uint32_t ms_per_frame() const noexcept { return ms_per_frame_; }
    // Clamped to at least 1 ms
    void set_ms_per_frame(std::uint32_t ms) noexcept;

    [[nodiscard]] std::uint64_t accumulated_ms() const noexcept { return accumulator_ms_; }

private:
    bool playing_ = false;
    std::size_t current_frame_ = 0;
    std::uint32_t ms_per_frame_;
    std::uint64_t accumulator_ms_ = 0;
    clock::time_point last_tick_;
};

} // namespace shpkit

#endif // SHPKIT_PLAYBACK_HPP_
