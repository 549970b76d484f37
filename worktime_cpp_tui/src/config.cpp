#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>

namespace worktime {

namespace {

std::string to_lower(std::string s) {
    for (char& ch : s) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

std::optional<long long> to_ll(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const long long v = std::strtoll(value.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

class EnvReader {
public:
    EnvReader(const EnvLookup& lookup, DashboardConfig& cfg) : lookup_(lookup), cfg_(cfg) {}

    std::optional<std::string> get(const char* name) const {
        const char* raw = lookup_ ? lookup_(name) : nullptr;
        if (raw == nullptr || *raw == '\0') {
            return std::nullopt;
        }
        return std::string(raw);
    }

    std::optional<long long> integer(const char* name, long long lo, long long hi) {
        const auto raw = get(name);
        if (!raw) {
            return std::nullopt;
        }
        const auto v = to_ll(*raw);
        if (!v || *v < lo || *v > hi) {
            reject(name, *raw, "expected an integer in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
            return std::nullopt;
        }
        return v;
    }

    void reject(const char* name, const std::string& value, const std::string& why) {
        cfg_.warnings.push_back(std::string(name) + "='" + value + "' ignored: " + why);
    }

private:
    const EnvLookup& lookup_;
    DashboardConfig& cfg_;
};

const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

} // namespace

DashboardConfig load_config(const EnvLookup& lookup) {
    DashboardConfig cfg;
    EnvReader env(lookup, cfg);

    const std::filesystem::path home = env.get("HOME").value_or(".");
    const std::filesystem::path base = home / ".worktime";
    cfg.log_path = base / "log.txt";
    cfg.debug_log_path = base / "worktime.log";

    if (const auto v = env.get("WORKTIME_LOG")) {
        cfg.log_path = *v;
    }
    if (const auto v = env.get("WORKTIME_DEBUG_LOG")) {
        cfg.debug_log_path = *v;
    }
    if (const auto v = env.get("WORKTIME_LOG_LEVEL")) {
        const std::string level = to_lower(*v);
        bool known = false;
        for (const char* name : kLevels) {
            known = known || level == name;
        }
        if (known) {
            cfg.log_level = level;
        } else {
            env.reject("WORKTIME_LOG_LEVEL", *v, "unknown level");
        }
    }
    if (const auto v = env.integer("WORKTIME_TICK_MS", 100, 60000)) {
        cfg.tick_interval = std::chrono::milliseconds(*v);
    }
    if (const auto v = env.get("WORKTIME_TOP_GROUPING")) {
        const std::string mode = to_lower(*v);
        if (mode == "tag") {
            cfg.top_grouping = TopGrouping::Tag;
        } else if (mode == "task") {
            cfg.top_grouping = TopGrouping::Task;
        } else {
            env.reject("WORKTIME_TOP_GROUPING", *v, "expected 'tag' or 'task'");
        }
    }
    if (const auto v = env.integer("WORKTIME_TOP_LIMIT", 1, 100)) {
        cfg.top_limit = static_cast<size_t>(*v);
    }
    if (const auto v = env.integer("WORKTIME_DAY_TARGET_MIN", 0, 24 * 60)) {
        cfg.day_target = std::chrono::minutes(*v);
    }
    if (const auto v = env.integer("WORKTIME_WEEK_TARGET_MIN", 0, 7 * 24 * 60)) {
        cfg.week_target = std::chrono::minutes(*v);
    }
    if (const auto v = env.get("WORKTIME_WEEK_START")) {
        const std::string day = to_lower(*v);
        if (day == "monday" || day == "mon") {
            cfg.week_start = WeekStart::Monday;
        } else if (day == "sunday" || day == "sun") {
            cfg.week_start = WeekStart::Sunday;
        } else {
            env.reject("WORKTIME_WEEK_START", *v, "expected 'monday' or 'sunday'");
        }
    }
    if (const auto v = env.integer("WORKTIME_NOTICE_SEC", 0, 3600)) {
        cfg.notice_ttl = std::chrono::seconds(*v);
    }
    return cfg;
}

DashboardConfig load_config() {
    return load_config([](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace worktime
