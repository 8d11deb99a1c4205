// src/utils.cpp
// Implementation of utility functions for common operations

#include "vdalign/utils.hpp"
#include <algorithm>
#include <sstream>
#include <regex>
#include <fstream>
#include <iomanip>
#include <cctype>
#include <ctime>

namespace vdalign {
namespace Utils {

// String utilities
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << separator;
        oss << parts[i];
    }
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& text) {
    // Iterative wildcard match with single-star backtracking
    size_t p = 0, t = 0;
    size_t star = std::string::npos, mark = 0;

    auto same = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || same(pattern[p], text[t]))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

// Network utilities
std::pair<std::string, uint16_t> parse_endpoint(const std::string& endpoint) {
    size_t colon_pos = endpoint.find_last_of(':');
    if (colon_pos == std::string::npos) {
        return {endpoint, 0};
    }

    std::string host = endpoint.substr(0, colon_pos);
    std::string port_str = endpoint.substr(colon_pos + 1);

    try {
        unsigned long port = std::stoul(port_str);
        if (port == 0 || port > 65535) {
            return {"", 0};
        }
        return {host, static_cast<uint16_t>(port)};
    } catch (const std::exception&) {
        return {"", 0};
    }
}

bool is_valid_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.length() > 253) {
        return false;
    }

    static const std::regex hostname_regex(R"(^[a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?(\.[a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?)*$)");
    return std::regex_match(hostname, hostname_regex);
}

bool is_valid_endpoint(const std::string& endpoint) {
    auto parsed = parse_endpoint(endpoint);
    if (endpoint.find(':') != std::string::npos && parsed.second == 0) {
        return false;
    }
    return is_valid_hostname(parsed.first);
}

// Pattern utilities
bool is_valid_regex(const std::string& pattern, std::string* reason) {
    if (pattern.empty()) {
        if (reason) *reason = "empty pattern";
        return false;
    }
    try {
        std::regex compiled(pattern, std::regex::ECMAScript | std::regex::icase);
        (void)compiled;
        return true;
    } catch (const std::regex_error& e) {
        if (reason) *reason = e.what();
        return false;
    }
}

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms) {
    std::time_t time_t = static_cast<std::time_t>(timestamp_ms / 1000);
    auto ms = timestamp_ms % 1000;

    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t);
#else
    gmtime_r(&time_t, &tm_utc);
#endif

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return ss.str();
}

std::string time_point_to_iso8601(SystemTime time) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    return timestamp_to_iso8601(static_cast<Timestamp>(ms < 0 ? 0 : ms));
}

std::string current_iso8601_timestamp() {
    return timestamp_to_iso8601(now_milliseconds());
}

std::string format_duration(std::chrono::milliseconds duration) {
    long long total_ms = duration.count();
    if (total_ms < 0) total_ms = 0;

    long long hours = total_ms / 3600000;
    long long minutes = (total_ms / 60000) % 60;
    long long seconds = (total_ms / 1000) % 60;
    long long millis = total_ms % 1000;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
            << std::setw(2) << seconds << "s";
    } else if (minutes > 0) {
        oss << minutes << "m " << std::setfill('0') << std::setw(2) << seconds << "s";
    } else {
        oss << seconds << "." << std::setfill('0') << std::setw(3) << millis << "s";
    }
    return oss.str();
}

// File utilities
bool file_exists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

std::string read_file_contents(const std::string& path) {
    std::ifstream file(path);
    if (!file) return "";

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool write_file_contents(const std::string& path, const std::string& contents) {
    std::ofstream file(path);
    if (!file) return false;

    file << contents;
    return file.good();
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer()
    : start_time_(Clock::now()) {}

ScopedTimer::Duration ScopedTimer::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

} // namespace Utils
} // namespace vdalign
