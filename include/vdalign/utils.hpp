// include/vdalign/utils.hpp
// Purpose: Utility functions and helpers for the vdalign engine
// String, matching, time and file helpers used across components

#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace vdalign {
namespace Utils {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Case-insensitive glob match supporting '*' and '?'
bool glob_match(const std::string& pattern, const std::string& text);

// Network utilities
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint);
bool is_valid_hostname(const std::string& hostname);
bool is_valid_endpoint(const std::string& endpoint);

// Pattern utilities
bool is_valid_regex(const std::string& pattern, std::string* reason = nullptr);

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms);
std::string time_point_to_iso8601(SystemTime time);
std::string current_iso8601_timestamp();
std::string format_duration(std::chrono::milliseconds duration);

// File utilities
bool file_exists(const std::string& path);
std::string read_file_contents(const std::string& path);
bool write_file_contents(const std::string& path, const std::string& contents);

// Monotonic timer started at construction
class ScopedTimer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;

    ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    TimePoint started() const { return start_time_; }
    Duration elapsed() const;

private:
    TimePoint start_time_;
};

} // namespace Utils
} // namespace vdalign
