#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "interval.hpp"
#include "time_window.hpp"

namespace worktime {

enum class TopGrouping {
    Tag,
    Task
};

struct DashboardConfig {
    std::filesystem::path log_path;
    std::filesystem::path debug_log_path;
    std::string           log_level = "info";

    // Longest idle wait before the dashboard redraws on its own. This is the
    // tick that advances the running task's elapsed time.
    std::chrono::milliseconds tick_interval{1000};

    TopGrouping top_grouping = TopGrouping::Tag;
    size_t      top_limit    = 20;
    Duration    day_target   = std::chrono::hours(8);
    Duration    week_target  = std::chrono::hours(40);
    WeekStart   week_start   = WeekStart::Monday;
    // 0 keeps a notification until the next one replaces it.
    Duration notice_ttl = std::chrono::seconds(8);

    // Rejected settings, one message each.
    std::vector<std::string> warnings;
};

using EnvLookup = std::function<const char*(const char*)>;

DashboardConfig load_config(const EnvLookup& lookup);
DashboardConfig load_config();

} // namespace worktime
