#pragma once

#include <array>
#include <cstddef>

namespace worktime {

enum class ScrollPanel {
    Day,
    Week,
    Top
};

inline constexpr int kScrollPanelCount = 3;

const char* scroll_panel_name(ScrollPanel panel);

// Which list owns the arrow keys, and how far each list is scrolled.
// Offsets survive redraws and reloads; the draw pass re-clamps them against the
// current row count and viewport.
class FocusState {
public:
    ScrollPanel focused() const { return focused_; }
    bool        is_focused(ScrollPanel panel) const { return focused_ == panel; }
    void        focus_next();

    int  offset(ScrollPanel panel) const { return offsets_[index(panel)]; }
    void scroll(int delta);
    void reset(ScrollPanel panel);

    // Clamps the stored offset to max(0, row_count - viewport) and remembers
    // that bound for later scroll() calls.
    int clamp(ScrollPanel panel, int row_count, int viewport);

private:
    static size_t index(ScrollPanel panel) { return static_cast<size_t>(panel); }

    ScrollPanel                         focused_ = ScrollPanel::Day;
    std::array<int, kScrollPanelCount>  offsets_{};
    std::array<int, kScrollPanelCount>  max_offsets_{-1, -1, -1};
};

} // namespace worktime
