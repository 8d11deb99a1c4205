// include/vdalign/errors.hpp
// Purpose: Error handling system for the vdalign engine
// Provides hierarchical error types for configuration, endpoint, query, action and task failures

#pragma once

#include <stdexcept>
#include <string>
#include <chrono>
#include <system_error>

namespace vdalign {

// Base error category for vdalign errors
class VdalignErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "vdalign";
    }

    std::string message(int ev) const override;
};

// Global error category instance
const VdalignErrorCategory& vdalign_error_category();

// Error codes enum
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Configuration errors (1-99)
    INVALID_CONFIG = 1,
    INVALID_ENDPOINT = 2,
    INVALID_PATTERN = 3,
    INVALID_LIMIT = 4,
    INVALID_TIMEOUT = 5,
    MISSING_NOTIFICATION = 6,
    CONFIG_PARSE_FAILED = 7,
    CONFIG_FILE_NOT_FOUND = 8,

    // Endpoint errors (100-199)
    ENDPOINT_UNREACHABLE = 100,
    PROBE_FAILED = 101,
    SITE_LOOKUP_FAILED = 102,
    NO_HEALTHY_ENDPOINT = 103,

    // Inventory and remote query errors (200-299)
    LISTING_FAILED = 200,
    QUERY_FAILED = 201,
    HOST_UNREACHABLE = 203,

    // Action errors (300-399)
    ENTITY_NOT_FOUND = 300,
    RESTART_REJECTED = 302,
    NOTIFICATION_FAILED = 303,

    // Task errors (400-499)
    TASK_NOT_FOUND = 400,
    TASK_POLL_FAILED = 401,

    // Run errors (500-599)
    COLLABORATOR_UNAVAILABLE = 500,

    // System errors (700-799)
    FILE_WRITE_FAILED = 701,

    // Unknown/Generic errors (800+)
    UNKNOWN_ERROR = 800
};

// Create error codes
std::error_code make_error_code(ErrorCode ec);

// Base exception class for all vdalign errors
class Error : public std::exception {
public:
    explicit Error(const std::string& message)
        : message_(message)
        , error_code_(ErrorCode::UNKNOWN_ERROR)
        , timestamp_(std::chrono::system_clock::now()) {}

    Error(ErrorCode code, const std::string& message)
        : message_(message)
        , error_code_(code)
        , timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept {
        return error_code_;
    }

    std::error_code error_code() const {
        return make_error_code(error_code_);
    }

    std::chrono::system_clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

    virtual std::string category() const {
        return "vdalign::Error";
    }

protected:
    std::string message_;
    ErrorCode error_code_;
    std::chrono::system_clock::time_point timestamp_;
};

// Configuration-related errors
class ConfigError : public Error {
public:
    ConfigError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Configuration error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "vdalign::ConfigError";
    }

private:
    std::string field_;
};

// Failures talking to a management endpoint
class EndpointError : public Error {
public:
    EndpointError(ErrorCode code, const std::string& endpoint, const std::string& operation,
                  const std::string& message)
        : Error(code, "Endpoint error during '" + operation + "' on " + endpoint + ": " + message)
        , endpoint_(endpoint)
        , operation_(operation) {}

    const std::string& endpoint() const noexcept {
        return endpoint_;
    }

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::string category() const override {
        return "vdalign::EndpointError";
    }

private:
    std::string endpoint_;
    std::string operation_;
};

// Failures resolving a host's disk image
class QueryError : public Error {
public:
    QueryError(ErrorCode code, const std::string& host, const std::string& message)
        : Error(code, "Query error for host '" + host + "': " + message)
        , host_(host) {}

    const std::string& host() const noexcept {
        return host_;
    }

    std::string category() const override {
        return "vdalign::QueryError";
    }

private:
    std::string host_;
};

// Failures submitting a restart or notification
class ActionError : public Error {
public:
    ActionError(ErrorCode code, const std::string& entity, const std::string& action,
                const std::string& message)
        : Error(code, "Action '" + action + "' on '" + entity + "' failed: " + message)
        , entity_(entity)
        , action_(action) {}

    const std::string& entity() const noexcept {
        return entity_;
    }

    const std::string& action() const noexcept {
        return action_;
    }

    std::string category() const override {
        return "vdalign::ActionError";
    }

private:
    std::string entity_;
    std::string action_;
};

// Failures tracking an asynchronous power action
class TaskError : public Error {
public:
    TaskError(ErrorCode code, const std::string& task_id, const std::string& message)
        : Error(code, "Task error for '" + task_id + "': " + message)
        , task_id_(task_id) {}

    const std::string& task_id() const noexcept {
        return task_id_;
    }

    std::string category() const override {
        return "vdalign::TaskError";
    }

private:
    std::string task_id_;
};

// System-related errors
class SystemError : public Error {
public:
    SystemError(ErrorCode code, const std::string& message)
        : Error(code, "System error: " + message) {}

    std::string category() const override {
        return "vdalign::SystemError";
    }
};

// Aborts the run before any analysis takes place
class FatalError : public Error {
public:
    FatalError(ErrorCode code, const std::string& message)
        : Error(code, "Fatal: " + message) {}

    std::string category() const override {
        return "vdalign::FatalError";
    }
};

// Error factory functions for common error scenarios
namespace Errors {

// Configuration errors
ConfigError invalid_endpoint(const std::string& endpoint);
ConfigError invalid_pattern(const std::string& field, const std::string& pattern, const std::string& reason);
ConfigError invalid_limit(const std::string& field, long long value, long long min, long long max);
ConfigError invalid_timeout(const std::string& field, std::chrono::milliseconds value,
                            std::chrono::milliseconds min, std::chrono::milliseconds max);
ConfigError missing_notification(const std::string& field);
ConfigError parse_failed(const std::string& source, const std::string& reason);
ConfigError file_not_found(const std::string& path);

// Endpoint errors
EndpointError probe_failed(const std::string& endpoint, const std::string& reason);
EndpointError site_lookup_failed(const std::string& endpoint, const std::string& reason);
EndpointError listing_failed(const std::string& endpoint, const std::string& what, const std::string& reason);
FatalError no_healthy_endpoint(size_t candidates);
FatalError collaborator_unavailable(const std::string& name);

// Query errors
QueryError query_failed(const std::string& host, const std::string& reason);
QueryError host_unreachable(const std::string& host);

// Action errors
ActionError restart_rejected(const std::string& machine, const std::string& reason);
ActionError notification_failed(const std::string& session, const std::string& reason);
ActionError entity_not_found(const std::string& entity, const std::string& action);

// Task errors
TaskError task_not_found(const std::string& task_id);
TaskError task_poll_failed(const std::string& task_id, const std::string& reason);

// System errors
SystemError file_write_failed(const std::string& path);

} // namespace Errors

} // namespace vdalign

// Enable std::error_code support
namespace std {
template <>
struct is_error_code_enum<vdalign::ErrorCode> : true_type {};
}
