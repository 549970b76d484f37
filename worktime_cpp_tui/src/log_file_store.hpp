#pragma once

#include <filesystem>
#include <string>

#include "interval_store.hpp"

namespace worktime {

// "<start> <end|-> |<label>" per line, timestamps in UTC ISO-8601.
std::string format_record(const Interval& interval);

// Throws StoreError on a malformed record.
Interval parse_record(const std::string& line);

// Plain-text interval log. Rewrites go through a temporary file that is
// renamed over the log.
class LogFileStore : public IntervalStore {
public:
    explicit LogFileStore(std::filesystem::path path);

    Intervals read_all() override;
    void      append(const Interval& interval) override;
    void      write_all(const Intervals& intervals) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;

    void ensure_parent() const;
};

} // namespace worktime
