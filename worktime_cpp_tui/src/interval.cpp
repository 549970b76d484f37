#include "interval.hpp"

#include <algorithm>
#include <sstream>

namespace worktime {

std::vector<std::string> Interval::tags() const {
    std::vector<std::string> out;
    std::istringstream       words(label);
    std::string              word;
    while (words >> word) {
        if (word.size() < 2 || word.front() != '#') {
            continue;
        }
        std::string tag = word.substr(1);
        if (std::find(out.begin(), out.end(), tag) == out.end()) {
            out.push_back(std::move(tag));
        }
    }
    return out;
}

std::vector<std::string> Interval::tags_or_untagged() const {
    auto out = tags();
    if (out.empty()) {
        out.emplace_back(kUntaggedTag);
    }
    return out;
}

std::optional<size_t> find_open(const Intervals& intervals) {
    for (size_t i = intervals.size(); i > 0; --i) {
        if (intervals[i - 1].is_open()) {
            return i - 1;
        }
    }
    return std::nullopt;
}

const Interval* last_closed(const Intervals& intervals) {
    for (auto it = intervals.rbegin(); it != intervals.rend(); ++it) {
        if (!it->is_open()) {
            return &*it;
        }
    }
    return nullptr;
}

Instant now_instant() {
    return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
}

} // namespace worktime
