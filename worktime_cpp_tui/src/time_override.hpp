#pragma once

#include <optional>
#include <string>

#include "interval.hpp"

namespace worktime {

// A confirmed start prompt, split into the label and its @HH:MM times.
struct StartRequest {
    std::string            label;
    std::optional<Instant> start; // one or two times given
    std::optional<Instant> end;   // two times given: a finished interval
    std::string            error; // non-empty when the times are unusable
};

// `@HH:MM` tokens are read as local wall-clock times on today's date and
// removed from the label.
StartRequest parse_start_request(const std::string& text, Instant now);

} // namespace worktime
