#ifndef SHPKIT_HISTORY_HPP_
#define SHPKIT_HISTORY_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/sprite.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace shpkit {

// ============================================================================
// Edit History
// ============================================================================

/**
 * Bounded undo/redo of whole-frame snapshots for the frame being edited.
 *
 * The stacks belong to a single frame, the anchor. Asking to undo or redo on
 * any other frame discards both stacks and re-anchors instead of restoring,
 * so a snapshot of one frame is never written into another.
 *
 * record() is meant to be called once per edit gesture (press to release),
 * before the gesture modifies the frame.
 */
class SHPKIT_EXPORT edit_history {
public:
    static constexpr std::size_t DEFAULT_MAX_DEPTH = 100;

    explicit edit_history(std::size_t max_depth = DEFAULT_MAX_DEPTH) noexcept;

    /**
     * Snapshot the frame before an edit. Clears the redo stack and evicts the
     * oldest snapshot once max_depth is exceeded. Recording for a frame other
     * than the anchor starts a fresh history for that frame.
     */
    void record(const frame& current, std::size_t active_index);

    /**
     * Restore the most recent snapshot, moving the current pixels to redo.
     * @return true if the frame changed
     */
    bool undo(frame& current, std::size_t active_index);

    /**
     * Reapply the most recently undone snapshot.
     * @return true if the frame changed
     */
    bool redo(frame& current, std::size_t active_index);

    /**
     * Drop both stacks and anchor to the given frame (or to none).
     */
    void reset(std::optional<std::size_t> anchor = std::nullopt) noexcept;

    [[nodiscard]] bool can_undo() const noexcept { return !undo_.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return !redo_.empty(); }
    [[nodiscard]] std::size_t undo_depth() const noexcept { return undo_.size(); }
    [[nodiscard]] std::size_t redo_depth() const noexcept { return redo_.size(); }
    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }
    [[nodiscard]] std::optional<std::size_t> anchor() const noexcept { return anchor_; }

    void set_max_depth(std::size_t max_depth);

private:
    // Re-anchors and clears on a frame switch; true if the call may proceed
    bool check_anchor(std::size_t active_index) noexcept;
    void trim();

    std::deque<std::vector<std::uint8_t>> undo_;
    std::vector<std::vector<std::uint8_t>> redo_;
    std::optional<std::size_t> anchor_;
    std::size_t max_depth_;
};

} // namespace shpkit

#endif // SHPKIT_HISTORY_HPP_
