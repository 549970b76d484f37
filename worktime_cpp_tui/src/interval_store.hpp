#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "interval.hpp"

namespace worktime {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// Where intervals live. Implementations throw StoreError on I/O failure or a
// corrupt record; an empty or missing store reads as no intervals.
class IntervalStore {
public:
    virtual ~IntervalStore() = default;

    virtual Intervals read_all() = 0;
    virtual void      append(const Interval& interval) = 0;
    virtual void      write_all(const Intervals& intervals) = 0;
};

struct Overlap {
    Interval existing;
    Duration overlap{0};
};

// First stored interval sharing a positive duration with `candidate`; open
// ends count as `now`.
std::optional<Overlap> check_overlap(const Intervals& intervals, const Interval& candidate, Instant now);

} // namespace worktime
