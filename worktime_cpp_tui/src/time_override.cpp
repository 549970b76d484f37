#include "time_override.hpp"

#include <sstream>
#include <vector>

#include "civil_time.hpp"
#include "text_util.hpp"

namespace worktime {

StartRequest parse_start_request(const std::string& text, Instant now) {
    StartRequest req;
    std::vector<Instant> times;
    std::string words;

    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        if (token.size() < 2 || token.front() != '@') {
            words += token;
            words += ' ';
            continue;
        }
        const auto hm = parse_time_of_day(token.substr(1));
        if (!hm) {
            req.error = "Invalid time: " + token;
            return req;
        }
        times.push_back(local_instant(local_date(now), hm->first, hm->second));
    }
    req.label = collapse_spaces(words);

    if (times.size() > 2) {
        req.error = "At most two @HH:MM times are allowed.";
        return req;
    }
    if (times.size() == 1) {
        if (times[0] > now) {
            req.error = "Start time is in the future.";
            return req;
        }
        req.start = times[0];
    } else if (times.size() == 2) {
        if (times[1] <= times[0]) {
            req.error = "End must be after start.";
            return req;
        }
        if (times[1] > now) {
            req.error = "End time is in the future.";
            return req;
        }
        req.start = times[0];
        req.end = times[1];
    }
    return req;
}

} // namespace worktime
