#include <map>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

using namespace worktime;

namespace {

// Fake environment for load_config.
class Env {
public:
    Env& set(const std::string& name, const std::string& value) {
        vars_[name] = value;
        return *this;
    }

    EnvLookup lookup() const {
        return [this](const char* name) -> const char* {
            const auto it = vars_.find(name);
            return it == vars_.end() ? nullptr : it->second.c_str();
        };
    }

private:
    std::map<std::string, std::string> vars_;
};

} // namespace

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("defaults under HOME") {
    Env env;
    env.set("HOME", "/home/u");
    const DashboardConfig cfg = load_config(env.lookup());

    CHECK(cfg.log_path == std::filesystem::path("/home/u/.worktime/log.txt"));
    CHECK(cfg.debug_log_path == std::filesystem::path("/home/u/.worktime/worktime.log"));
    CHECK(cfg.log_level == "info");
    CHECK(cfg.tick_interval == std::chrono::milliseconds(1000));
    CHECK(cfg.top_grouping == TopGrouping::Tag);
    CHECK(cfg.top_limit == 20);
    CHECK(cfg.day_target == std::chrono::hours(8));
    CHECK(cfg.week_target == std::chrono::hours(40));
    CHECK(cfg.week_start == WeekStart::Monday);
    CHECK(cfg.notice_ttl == std::chrono::seconds(8));
    CHECK(cfg.warnings.empty());
}

TEST_CASE("missing HOME falls back to the working directory") {
    Env env;
    const DashboardConfig cfg = load_config(env.lookup());
    CHECK(cfg.log_path == std::filesystem::path("./.worktime/log.txt"));
}

// ============================================================================
// Overrides
// ============================================================================

TEST_CASE("every setting can be overridden") {
    Env env;
    env.set("WORKTIME_LOG", "/tmp/w/log.txt")
        .set("WORKTIME_DEBUG_LOG", "/tmp/w/debug.log")
        .set("WORKTIME_LOG_LEVEL", "DEBUG")
        .set("WORKTIME_TICK_MS", "250")
        .set("WORKTIME_TOP_GROUPING", "task")
        .set("WORKTIME_TOP_LIMIT", "5")
        .set("WORKTIME_DAY_TARGET_MIN", "450")
        .set("WORKTIME_WEEK_TARGET_MIN", "2250")
        .set("WORKTIME_WEEK_START", "Sunday")
        .set("WORKTIME_NOTICE_SEC", "0");
    const DashboardConfig cfg = load_config(env.lookup());

    CHECK(cfg.log_path == std::filesystem::path("/tmp/w/log.txt"));
    CHECK(cfg.debug_log_path == std::filesystem::path("/tmp/w/debug.log"));
    CHECK(cfg.log_level == "debug");
    CHECK(cfg.tick_interval == std::chrono::milliseconds(250));
    CHECK(cfg.top_grouping == TopGrouping::Task);
    CHECK(cfg.top_limit == 5);
    CHECK(cfg.day_target == std::chrono::minutes(450));
    CHECK(cfg.week_target == std::chrono::minutes(2250));
    CHECK(cfg.week_start == WeekStart::Sunday);
    CHECK(cfg.notice_ttl == Duration::zero());
    CHECK(cfg.warnings.empty());
}

TEST_CASE("invalid values keep the default and warn") {
    Env env;
    env.set("WORKTIME_TICK_MS", "5")
        .set("WORKTIME_TOP_LIMIT", "ten")
        .set("WORKTIME_TOP_GROUPING", "project")
        .set("WORKTIME_WEEK_START", "friday")
        .set("WORKTIME_LOG_LEVEL", "loud")
        .set("WORKTIME_NOTICE_SEC", "12s");
    const DashboardConfig cfg = load_config(env.lookup());

    CHECK(cfg.tick_interval == std::chrono::milliseconds(1000));
    CHECK(cfg.top_limit == 20);
    CHECK(cfg.top_grouping == TopGrouping::Tag);
    CHECK(cfg.week_start == WeekStart::Monday);
    CHECK(cfg.log_level == "info");
    CHECK(cfg.notice_ttl == std::chrono::seconds(8));
    REQUIRE(cfg.warnings.size() == 6);
    CHECK(cfg.warnings[0].find("WORKTIME_LOG_LEVEL") == 0);
}

TEST_CASE("empty variables count as unset") {
    Env env;
    env.set("WORKTIME_TICK_MS", "");
    const DashboardConfig cfg = load_config(env.lookup());
    CHECK(cfg.tick_interval == std::chrono::milliseconds(1000));
    CHECK(cfg.warnings.empty());
}
