#include "log_file_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "civil_time.hpp"
#include "text_util.hpp"

namespace worktime {

namespace fs = std::filesystem;

std::string format_record(const Interval& interval) {
    const std::string end = interval.end ? format_iso_utc(*interval.end) : "-";
    return format_iso_utc(interval.start) + " " + end + "|" + trimmed(interval.label);
}

Interval parse_record(const std::string& line) {
    const auto bar = line.find('|');
    if (bar == std::string::npos) {
        throw StoreError("record must contain a '|' separator");
    }
    std::istringstream times(line.substr(0, bar));
    std::string start_raw;
    std::string end_raw;
    std::string extra;
    if (!(times >> start_raw >> end_raw) || (times >> extra)) {
        throw StoreError("record must have a start and an end column");
    }

    Interval interval;
    const auto start = parse_iso8601(start_raw);
    if (!start) {
        throw StoreError("bad start time '" + start_raw + "'");
    }
    interval.start = *start;
    if (end_raw != "-") {
        const auto end = parse_iso8601(end_raw);
        if (!end) {
            throw StoreError("bad end time '" + end_raw + "'");
        }
        interval.end = *end;
    }
    interval.label = trimmed(line.substr(bar + 1));
    return interval;
}

LogFileStore::LogFileStore(fs::path path) : path_(std::move(path)) {}

void LogFileStore::ensure_parent() const {
    const fs::path parent = path_.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw StoreError("cannot create " + parent.string() + ": " + ec.message());
    }
}

Intervals LogFileStore::read_all() {
    Intervals intervals;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw StoreError("cannot stat " + path_.string() + ": " + ec.message());
        }
        spdlog::debug("log {} does not exist yet", path_.string());
        return intervals;
    }

    std::ifstream in(path_);
    if (!in) {
        throw StoreError("cannot open " + path_.string());
    }
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string stripped = trimmed(line);
        if (stripped.empty() || stripped.front() == '#') {
            continue;
        }
        try {
            intervals.push_back(parse_record(stripped));
        } catch (const StoreError& e) {
            throw StoreError(path_.string() + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
    if (in.bad()) {
        throw StoreError("read error on " + path_.string());
    }
    spdlog::debug("loaded {} intervals from {}", intervals.size(), path_.string());
    return intervals;
}

void LogFileStore::append(const Interval& interval) {
    ensure_parent();
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw StoreError("cannot open " + path_.string() + " for append");
    }
    out << format_record(interval) << '\n';
    out.flush();
    if (!out) {
        throw StoreError("write error on " + path_.string());
    }
}

void LogFileStore::write_all(const Intervals& intervals) {
    ensure_parent();
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw StoreError("cannot open " + tmp.string() + " for writing");
        }
        for (const auto& interval : intervals) {
            out << format_record(interval) << '\n';
        }
        out.flush();
        if (!out) {
            throw StoreError("write error on " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw StoreError("cannot replace " + path_.string() + ": " + ec.message());
    }
    spdlog::debug("rewrote {} with {} intervals", path_.string(), intervals.size());
}

} // namespace worktime
