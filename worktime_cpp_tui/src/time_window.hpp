#pragma once

#include "interval.hpp"

namespace worktime {

enum class WeekStart {
    Monday,
    Sunday
};

// Half-open [start, end).
struct Window {
    Instant start;
    Instant end;

    Duration length() const { return end - start; }
};

// Local midnight today -> local midnight tomorrow.
Window day_window(Instant now);

// Local midnight of the most recent `first` day -> seven calendar days later.
Window week_window(Instant now, WeekStart first = WeekStart::Monday);

} // namespace worktime
