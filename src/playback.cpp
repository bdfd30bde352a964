#include <shpkit/playback.hpp>

#include <algorithm>
#include <limits>

namespace shpkit {

playback::playback(std::uint32_t ms_per_frame) noexcept
    : ms_per_frame_(std::max<std::uint32_t>(ms_per_frame, 1)),
      last_tick_(clock::now()) {}

void playback::play() noexcept {
    if (!playing_) {
        playing_ = true;
        last_tick_ = clock::now();
    }
}

void playback::set_ms_per_frame(std::uint32_t ms) noexcept {
    ms_per_frame_ = std::max<std::uint32_t>(ms, 1);
}

std::optional<std::size_t> playback::advance(std::uint64_t elapsed_ms, std::size_t frame_count) noexcept {
    if (!playing_ || frame_count == 0) {
        return std::nullopt;
    }

    // Saturating add
    const auto headroom = std::numeric_limits<std::uint64_t>::max() - accumulator_ms_;
    accumulator_ms_ += std::min(elapsed_ms, headroom);

    const std::uint64_t steps = accumulator_ms_ / ms_per_frame_;
    if (steps == 0) {
        return std::nullopt;
    }
    accumulator_ms_ -= steps * ms_per_frame_;
    current_frame_ = static_cast<std::size_t>((current_frame_ % frame_count + steps % frame_count) % frame_count);
    return current_frame_;
}

std::optional<std::size_t> playback::tick(std::size_t frame_count) noexcept {
    const auto now = clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick_);
    // Sub-millisecond remainder stays in last_tick_
    last_tick_ += elapsed;
    const auto ms = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0;
    return advance(ms, frame_count);
}

} // namespace shpkit
