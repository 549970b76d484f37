#include "layout.hpp"

#include <algorithm>
#include <numeric>

namespace worktime {

namespace {

const std::vector<PanelSpec> kLeftColumn = {
    {3, 0}, // status
    {3, 2}, // day entries
    {5, 3}, // week entries
    {4, 3}, // top list
};

const std::vector<PanelSpec> kRightColumn = {
    {6, 1}, // current task
    {6, 0}, // targets
};

int sum_of(const std::vector<int>& values) {
    return std::accumulate(values.begin(), values.end(), 0);
}

void shrink_to_fit(std::vector<int>& heights, int total) {
    int sum = sum_of(heights);
    while (sum > total) {
        size_t tallest = 0;
        for (size_t i = 0; i < heights.size(); ++i) {
            if (heights[i] >= heights[tallest]) {
                tallest = i;
            }
        }
        if (heights[tallest] <= 1) {
            break;
        }
        --heights[tallest];
        --sum;
    }
    for (size_t i = heights.size(); i > 0 && sum > total; --i) {
        sum -= heights[i - 1];
        heights[i - 1] = 0;
    }
}

} // namespace

std::vector<int> allocate_heights(int total, const std::vector<PanelSpec>& panels) {
    std::vector<int> heights(panels.size(), 0);
    if (total <= 0 || panels.empty()) {
        return heights;
    }

    int min_sum = 0;
    int weight_sum = 0;
    for (size_t i = 0; i < panels.size(); ++i) {
        heights[i] = std::max(1, panels[i].min_height);
        min_sum += heights[i];
        weight_sum += std::max(0, panels[i].weight);
    }

    if (min_sum >= total) {
        shrink_to_fit(heights, total);
        return heights;
    }

    const int extra = total - min_sum;
    int given = 0;
    if (weight_sum > 0) {
        for (size_t i = 0; i < panels.size(); ++i) {
            const int share = extra * std::max(0, panels[i].weight) / weight_sum;
            heights[i] += share;
            given += share;
        }
    }
    heights.back() += extra - given;
    return heights;
}

DashboardLayout compute_dashboard_layout(int rows, int cols) {
    DashboardLayout layout;
    if (rows <= 0 || cols <= 0) {
        return layout;
    }

    const int footer_h = std::min(kFooterHeight, rows);
    const int content_h = rows - footer_h;
    layout.footer = {content_h, 0, footer_h, cols};

    const int left_w = std::min(cols, std::max(cols * 38 / 100, kMinLeftWidth));
    const int right_x = left_w + 1;
    const int right_w = std::max(0, cols - right_x);

    const auto left = allocate_heights(content_h, kLeftColumn);
    int y = 0;
    Rect* left_rects[] = {&layout.status, &layout.day, &layout.week, &layout.top};
    for (size_t i = 0; i < left.size(); ++i) {
        *left_rects[i] = {y, 0, left[i], left_w};
        y += left[i];
    }

    const auto right = allocate_heights(content_h, kRightColumn);
    layout.current = {0, right_x, right[0], right_w};
    layout.targets = {right[0], right_x, right[1], right_w};
    return layout;
}

} // namespace worktime
