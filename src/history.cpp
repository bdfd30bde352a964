#include <shpkit/history.hpp>

#include <algorithm>
#include <utility>

namespace shpkit {

edit_history::edit_history(std::size_t max_depth) noexcept
    : max_depth_(std::max<std::size_t>(max_depth, 1)) {}

bool edit_history::check_anchor(std::size_t active_index) noexcept {
    if (!anchor_) {
        anchor_ = active_index;
        return true;
    }
    if (*anchor_ != active_index) {
        reset(active_index);
        return false;
    }
    return true;
}

void edit_history::record(const frame& current, std::size_t active_index) {
    if (anchor_ && *anchor_ != active_index) {
        undo_.clear();
    }
    anchor_ = active_index;

    undo_.push_back(current.pixels);
    redo_.clear();
    trim();
}

bool edit_history::undo(frame& current, std::size_t active_index) {
    if (!check_anchor(active_index) || undo_.empty()) {
        return false;
    }

    std::vector<std::uint8_t> previous = std::move(undo_.back());
    undo_.pop_back();
    redo_.push_back(std::exchange(current.pixels, std::move(previous)));
    return true;
}

bool edit_history::redo(frame& current, std::size_t active_index) {
    if (!check_anchor(active_index) || redo_.empty()) {
        return false;
    }

    std::vector<std::uint8_t> next = std::move(redo_.back());
    redo_.pop_back();
    undo_.push_back(std::exchange(current.pixels, std::move(next)));
    trim();
    return true;
}

void edit_history::reset(std::optional<std::size_t> anchor) noexcept {
    undo_.clear();
    redo_.clear();
    anchor_ = anchor;
}

void edit_history::set_max_depth(std::size_t max_depth) {
    max_depth_ = std::max<std::size_t>(max_depth, 1);
    trim();
}

void edit_history::trim() {
    while (undo_.size() > max_depth_) {
        undo_.pop_front();
    }
}

} // namespace shpkit
