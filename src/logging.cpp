// src/logging.cpp
// Implementation of the run-scoped diagnostic logger

#include "vdalign/logging.hpp"
#include "vdalign/utils.hpp"
#include <iostream>

namespace vdalign {

Logger::Logger() : Logger(LoggingConfig{}) {}

Logger::Logger(const LoggingConfig& config)
    : level_(config.level)
    , console_(config.log_to_console) {
    if (!config.log_file_path.empty()) {
        file_.open(config.log_file_path, std::ios::out | std::ios::app);
        if (!file_) {
            std::cerr << "Failed to open log file: " << config.log_file_path << std::endl;
        }
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::error(const std::string& message) {
    log(SystemLogLevel::ERROR, message);
}

void Logger::warn(const std::string& message) {
    log(SystemLogLevel::WARN, message);
}

void Logger::info(const std::string& message) {
    log(SystemLogLevel::INFO, message);
}

void Logger::debug(const std::string& message) {
    log(SystemLogLevel::DEBUG, message);
}

void Logger::trace(const std::string& message) {
    log(SystemLogLevel::TRACE, message);
}

void Logger::log(SystemLogLevel level, const std::string& message) {
    if (level == SystemLogLevel::NONE || !should_log(level)) {
        return;
    }

    std::string line = format_line(level, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
        std::cerr << line << std::endl;
    }
    if (file_.is_open()) {
        file_ << line << '\n';
    }
    if (capture_) {
        capture_(level, message);
    }
}

bool Logger::should_log(SystemLogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(level_);
}

void Logger::set_level(SystemLogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

SystemLogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_console(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enable;
}

void Logger::set_capture(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    capture_ = std::move(sink);
}

std::string Logger::format_line(SystemLogLevel level, const std::string& message) {
    return Utils::current_iso8601_timestamp() + " [" + level_name(level) + "] " + message;
}

const char* Logger::level_name(SystemLogLevel level) noexcept {
    switch (level) {
        case SystemLogLevel::NONE: return "NONE";
        case SystemLogLevel::ERROR: return "ERROR";
        case SystemLogLevel::WARN: return "WARN";
        case SystemLogLevel::INFO: return "INFO";
        case SystemLogLevel::DEBUG: return "DEBUG";
        case SystemLogLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

} // namespace vdalign
