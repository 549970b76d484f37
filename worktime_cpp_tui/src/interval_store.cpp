#include "interval_store.hpp"

#include <algorithm>

namespace worktime {

std::optional<Overlap> check_overlap(const Intervals& intervals, const Interval& candidate, Instant now) {
    const Instant candidate_end = candidate.end.value_or(now);
    for (const auto& existing : intervals) {
        const Instant existing_end = existing.end.value_or(now);
        if (candidate.start >= existing_end || candidate_end <= existing.start) {
            continue;
        }
        const Duration overlap = std::min(existing_end, candidate_end) - std::max(candidate.start, existing.start);
        if (overlap > Duration{0}) {
            return Overlap{existing, overlap};
        }
    }
    return std::nullopt;
}

} // namespace worktime
