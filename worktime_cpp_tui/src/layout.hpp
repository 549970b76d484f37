#pragma once

#include <vector>

namespace worktime {

struct Rect {
    int y = 0;
    int x = 0;
    int h = 0;
    int w = 0;

    int bottom() const { return y + h; }
    int right() const { return x + w; }
};

struct PanelSpec {
    int min_height = 1;
    int weight     = 0;
};

// Splits `total` rows among panels. Below the sum of minimums the tallest
// panel gives up a row at a time (ties: the later panel) down to 1; with fewer
// rows than panels the trailing panels collapse to 0. Above it, the surplus is
// shared by weight and the rounding remainder goes to the last panel.
std::vector<int> allocate_heights(int total, const std::vector<PanelSpec>& panels);

inline constexpr int kFooterHeight = 2;
inline constexpr int kMinLeftWidth = 28;

struct DashboardLayout {
    Rect status;
    Rect day;
    Rect week;
    Rect top;
    Rect current;
    Rect targets;
    Rect footer;
};

DashboardLayout compute_dashboard_layout(int rows, int cols);

} // namespace worktime
