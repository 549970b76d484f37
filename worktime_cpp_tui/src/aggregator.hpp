#pragma once

#include <string>
#include <vector>

#include "interval.hpp"
#include "time_window.hpp"

namespace worktime {

struct RankedTotal {
    std::string key;
    Duration    duration{0};
};

// An interval as seen through a window: start/end are clipped to it, and a
// running interval ends at min(now, window end).
struct RangeRow {
    Instant     start;
    Instant     end;
    Duration    duration{0};
    std::string label;
    bool        running = false;
};

Duration clip(const Interval& interval, const Window& window, Instant now);

Duration total(const Intervals& intervals, const Window& window, Instant now);

// Every tag of an interval is credited with the interval's whole clipped
// duration, so tag totals may sum to more than total(). Ties keep first-seen
// order.
std::vector<RankedTotal> by_tag(const Intervals& intervals, const Window& window, Instant now, size_t limit);

// Same ranking keyed on the trimmed label text.
std::vector<RankedTotal> by_task(const Intervals& intervals, const Window& window, Instant now, size_t limit);

// Chronological (clipped start ascending); equal starts keep store order.
std::vector<RangeRow> rows_for_range(const Intervals& intervals, const Window& window, Instant now);

} // namespace worktime
