#include "scroll_state.hpp"

#include <algorithm>

namespace worktime {

const char* scroll_panel_name(ScrollPanel panel) {
    switch (panel) {
        case ScrollPanel::Day: return "day";
        case ScrollPanel::Week: return "week";
        case ScrollPanel::Top: return "top";
    }
    return "day";
}

void FocusState::focus_next() {
    focused_ = static_cast<ScrollPanel>((static_cast<int>(focused_) + 1) % kScrollPanelCount);
}

void FocusState::scroll(int delta) {
    const size_t i = index(focused_);
    int next = std::max(0, offsets_[i] + delta);
    // -1: no draw has measured this list yet.
    if (max_offsets_[i] >= 0) {
        next = std::min(next, max_offsets_[i]);
    }
    offsets_[i] = next;
}

void FocusState::reset(ScrollPanel panel) {
    offsets_[index(panel)] = 0;
}

int FocusState::clamp(ScrollPanel panel, int row_count, int viewport) {
    const size_t i = index(panel);
    max_offsets_[i] = std::max(0, row_count - std::max(0, viewport));
    offsets_[i] = std::clamp(offsets_[i], 0, max_offsets_[i]);
    return offsets_[i];
}

} // namespace worktime
