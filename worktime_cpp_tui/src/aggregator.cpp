#include "aggregator.hpp"

#include <algorithm>
#include <unordered_map>

#include "text_util.hpp"

namespace worktime {

namespace {

class Ranking {
public:
    void add(const std::string& key, Duration d) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, totals_.size());
            totals_.push_back({key, d});
            return;
        }
        totals_[it->second].duration += d;
    }

    std::vector<RankedTotal> take(size_t limit) {
        std::stable_sort(totals_.begin(), totals_.end(),
                         [](const RankedTotal& a, const RankedTotal& b) { return a.duration > b.duration; });
        if (totals_.size() > limit) {
            totals_.resize(limit);
        }
        return std::move(totals_);
    }

private:
    std::vector<RankedTotal>                totals_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace

Duration clip(const Interval& interval, const Window& window, Instant now) {
    const Instant latest_start = std::max(interval.start, window.start);
    const Instant earliest_end = std::min(interval.end.value_or(now), window.end);
    if (earliest_end <= latest_start) {
        return Duration{0};
    }
    return earliest_end - latest_start;
}

Duration total(const Intervals& intervals, const Window& window, Instant now) {
    Duration sum{0};
    for (const auto& interval : intervals) {
        sum += clip(interval, window, now);
    }
    return sum;
}

std::vector<RankedTotal> by_tag(const Intervals& intervals, const Window& window, Instant now, size_t limit) {
    Ranking ranking;
    for (const auto& interval : intervals) {
        const Duration d = clip(interval, window, now);
        if (d <= Duration{0}) {
            continue;
        }
        for (const auto& tag : interval.tags_or_untagged()) {
            ranking.add(tag, d);
        }
    }
    return ranking.take(limit);
}

std::vector<RankedTotal> by_task(const Intervals& intervals, const Window& window, Instant now, size_t limit) {
    Ranking ranking;
    for (const auto& interval : intervals) {
        const Duration d = clip(interval, window, now);
        if (d <= Duration{0}) {
            continue;
        }
        ranking.add(trimmed(interval.label), d);
    }
    return ranking.take(limit);
}

std::vector<RangeRow> rows_for_range(const Intervals& intervals, const Window& window, Instant now) {
    std::vector<RangeRow> rows;
    for (const auto& interval : intervals) {
        const Duration d = clip(interval, window, now);
        if (d <= Duration{0}) {
            continue;
        }
        RangeRow row;
        row.start = std::max(interval.start, window.start);
        row.end = std::min(interval.end.value_or(now), window.end);
        row.duration = d;
        row.label = interval.label;
        row.running = interval.is_open();
        rows.push_back(std::move(row));
    }
    std::stable_sort(rows.begin(), rows.end(), [](const RangeRow& a, const RangeRow& b) { return a.start < b.start; });
    return rows;
}

} // namespace worktime
