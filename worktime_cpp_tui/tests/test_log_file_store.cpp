#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "log_file_store.hpp"
#include "test_support.hpp"

using namespace worktime;
using worktime::testing::utc;

namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed afterwards.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("worktime-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p);
    out << content;
}

} // namespace

// ============================================================================
// Record format
// ============================================================================

TEST_CASE("format_record") {
    const Interval closed{utc(2024, 3, 6, 9), utc(2024, 3, 6, 10, 15), "  Write docs #project "};
    CHECK(format_record(closed) == "2024-03-06T09:00:00+00:00 2024-03-06T10:15:00+00:00|Write docs #project");

    const Interval open{utc(2024, 3, 6, 11), std::nullopt, "Review"};
    CHECK(format_record(open) == "2024-03-06T11:00:00+00:00 -|Review");
}

TEST_CASE("parse_record") {
    SECTION("closed interval") {
        const Interval i = parse_record("2024-03-06T09:00:00+00:00 2024-03-06T10:15:00+00:00|Write docs");
        CHECK(i.start == utc(2024, 3, 6, 9));
        REQUIRE(i.end.has_value());
        CHECK(*i.end == utc(2024, 3, 6, 10, 15));
        CHECK(i.label == "Write docs");
    }
    SECTION("open interval with offset and fraction") {
        const Interval i = parse_record("2024-03-06T10:00:00.5+01:00 - | Review ");
        CHECK(i.start == utc(2024, 3, 6, 9));
        CHECK(i.is_open());
        CHECK(i.label == "Review");
    }
    SECTION("label may contain the separator") {
        const Interval i = parse_record("2024-03-06T09:00:00Z -|a|b");
        CHECK(i.label == "a|b");
    }
}

TEST_CASE("parse_record rejects malformed lines") {
    using Catch::Matchers::ContainsSubstring;
    CHECK_THROWS_AS(parse_record("no separator"), StoreError);
    CHECK_THROWS_AS(parse_record("2024-03-06T09:00:00Z|missing end"), StoreError);
    CHECK_THROWS_AS(parse_record("2024-03-06T09:00:00Z - extra|x"), StoreError);
    CHECK_THROWS_WITH(parse_record("yesterday -|x"), ContainsSubstring("bad start time"));
    CHECK_THROWS_WITH(parse_record("2024-03-06T09:00:00Z later|x"), ContainsSubstring("bad end time"));
}

// ============================================================================
// LogFileStore
// ============================================================================

TEST_CASE("missing log reads as empty") {
    TempDir dir;
    LogFileStore store(dir.path() / "nope" / "log.txt");
    CHECK(store.read_all().empty());
}

TEST_CASE("append creates parent directories and keeps order") {
    TempDir dir;
    const fs::path path = dir.path() / "sub" / "log.txt";
    LogFileStore store(path);

    store.append({utc(2024, 3, 6, 9), utc(2024, 3, 6, 10), "first #a"});
    store.append({utc(2024, 3, 6, 11), std::nullopt, "second"});

    const Intervals all = store.read_all();
    REQUIRE(all.size() == 2);
    CHECK(all[0].label == "first #a");
    CHECK(all[1].is_open());
    CHECK(find_open(all) == std::optional<size_t>(1));
}

TEST_CASE("write_all replaces the whole log") {
    TempDir dir;
    const fs::path path = dir.path() / "log.txt";
    LogFileStore store(path);
    store.append({utc(2024, 3, 6, 9), std::nullopt, "running"});

    Intervals all = store.read_all();
    all[0].end = utc(2024, 3, 6, 9, 30);
    store.write_all(all);

    CHECK(slurp(path) == "2024-03-06T09:00:00+00:00 2024-03-06T09:30:00+00:00|running\n");
    CHECK(!fs::exists(dir.path() / "log.txt.tmp"));
}

TEST_CASE("blank and comment lines are skipped") {
    TempDir dir;
    const fs::path path = dir.path() / "log.txt";
    write_file(path, "# worktime log\n\n2024-03-06T09:00:00+00:00 -|x\n   \n");
    LogFileStore store(path);
    CHECK(store.read_all().size() == 1);
}

TEST_CASE("corrupt record names file and line") {
    using Catch::Matchers::ContainsSubstring;
    TempDir dir;
    const fs::path path = dir.path() / "log.txt";
    write_file(path, "2024-03-06T09:00:00+00:00 -|ok\ngarbage\n");
    LogFileStore store(path);
    CHECK_THROWS_WITH(store.read_all(), ContainsSubstring("log.txt:2:"));
}

TEST_CASE("unwritable location raises StoreError") {
    TempDir dir;
    // A regular file where a directory is expected.
    write_file(dir.path() / "blocker", "x");
    LogFileStore store(dir.path() / "blocker" / "log.txt");
    const Interval entry{utc(2024, 3, 6, 9), std::nullopt, "x"};
    CHECK_THROWS_AS(store.append(entry), StoreError);
}

// ============================================================================
// Overlap
// ============================================================================

TEST_CASE("check_overlap") {
    const Instant now = utc(2024, 3, 6, 12);
    const Intervals all = {
        {utc(2024, 3, 6, 9), utc(2024, 3, 6, 10), "morning"},
        {utc(2024, 3, 6, 11), std::nullopt, "running"},
    };

    SECTION("touching ranges do not overlap") {
        CHECK(!check_overlap(all, {utc(2024, 3, 6, 10), utc(2024, 3, 6, 11), "gap"}, now));
    }
    SECTION("overlap with a closed interval") {
        const auto hit = check_overlap(all, {utc(2024, 3, 6, 9, 30), utc(2024, 3, 6, 10, 30), "x"}, now);
        REQUIRE(hit.has_value());
        CHECK(hit->existing.label == "morning");
        CHECK(hit->overlap == std::chrono::minutes(30));
    }
    SECTION("open interval counts up to now") {
        const auto hit = check_overlap(all, {utc(2024, 3, 6, 11, 45), utc(2024, 3, 6, 13), "x"}, now);
        REQUIRE(hit.has_value());
        CHECK(hit->existing.label == "running");
        CHECK(hit->overlap == std::chrono::minutes(15));
    }
}
