#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace worktime {

using Duration = std::chrono::seconds;
using Instant  = std::chrono::time_point<std::chrono::system_clock, Duration>;

inline constexpr const char* kUntaggedTag = "(untagged)";

// One logged stretch of work. `end` is empty while the task is still running.
struct Interval {
    Instant                start;
    std::optional<Instant> end;
    std::string            label;

    bool is_open() const { return !end.has_value(); }

    Duration duration(Instant now) const { return end.value_or(now) - start; }

    // `#tokens` of the label without the '#'. Duplicates are kept once, in
    // first-seen order.
    std::vector<std::string> tags() const;

    // tags(), or {"(untagged)"} when the label carries none.
    std::vector<std::string> tags_or_untagged() const;
};

using Intervals = std::vector<Interval>;

// Index of the last interval without an end.
std::optional<size_t> find_open(const Intervals& intervals);

// Last interval that has an end, if any.
const Interval* last_closed(const Intervals& intervals);

Instant now_instant();

} // namespace worktime
