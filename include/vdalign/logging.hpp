// include/vdalign/logging.hpp
// Purpose: Run-scoped diagnostic logger
// Writes "<timestamp> [LEVEL] message" lines to stderr and an optional file

#pragma once

#include "config.hpp"
#include <string>
#include <fstream>
#include <mutex>
#include <functional>

namespace vdalign {

class Logger {
public:
    // Receives every emitted line, after level filtering
    using Sink = std::function<void(SystemLogLevel, const std::string&)>;

    Logger();
    explicit Logger(const LoggingConfig& config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void error(const std::string& message);
    void warn(const std::string& message);
    void info(const std::string& message);
    void debug(const std::string& message);
    void trace(const std::string& message);

    void log(SystemLogLevel level, const std::string& message);
    bool should_log(SystemLogLevel level) const;

    void set_level(SystemLogLevel level);
    SystemLogLevel level() const;

    void set_console(bool enable);
    void set_capture(Sink sink);

    // Format a line without emitting it
    static std::string format_line(SystemLogLevel level, const std::string& message);
    static const char* level_name(SystemLogLevel level) noexcept;

private:
    mutable std::mutex mutex_;
    SystemLogLevel level_;
    bool console_;
    std::ofstream file_;
    Sink capture_;
};

} // namespace vdalign
