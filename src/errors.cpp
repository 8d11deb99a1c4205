// src/errors.cpp
// Implementation of error handling system with messages and factory functions

#include "vdalign/errors.hpp"
#include <sstream>

namespace vdalign {

// Error category implementation
std::string VdalignErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Configuration errors (1-99)
        case ErrorCode::INVALID_CONFIG:
            return "Invalid configuration";
        case ErrorCode::INVALID_ENDPOINT:
            return "Invalid endpoint address";
        case ErrorCode::INVALID_PATTERN:
            return "Invalid version pattern";
        case ErrorCode::INVALID_LIMIT:
            return "Limit out of range";
        case ErrorCode::INVALID_TIMEOUT:
            return "Timeout out of range";
        case ErrorCode::MISSING_NOTIFICATION:
            return "Notification title or text missing";
        case ErrorCode::CONFIG_PARSE_FAILED:
            return "Configuration could not be parsed";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:
            return "Configuration file not found";

        // Endpoint errors (100-199)
        case ErrorCode::ENDPOINT_UNREACHABLE:
            return "Endpoint unreachable";
        case ErrorCode::PROBE_FAILED:
            return "Health probe failed";
        case ErrorCode::SITE_LOOKUP_FAILED:
            return "Site lookup failed";
        case ErrorCode::NO_HEALTHY_ENDPOINT:
            return "No healthy endpoint found";

        // Inventory and remote query errors (200-299)
        case ErrorCode::LISTING_FAILED:
            return "Entity listing failed";
        case ErrorCode::QUERY_FAILED:
            return "Disk image query failed";
        case ErrorCode::HOST_UNREACHABLE:
            return "Host unreachable";

        // Action errors (300-399)
        case ErrorCode::ENTITY_NOT_FOUND:
            return "Entity not found";
        case ErrorCode::RESTART_REJECTED:
            return "Restart rejected";
        case ErrorCode::NOTIFICATION_FAILED:
            return "Notification failed";

        // Task errors (400-499)
        case ErrorCode::TASK_NOT_FOUND:
            return "Task not found";
        case ErrorCode::TASK_POLL_FAILED:
            return "Task poll failed";

        // Run errors (500-599)
        case ErrorCode::COLLABORATOR_UNAVAILABLE:
            return "Required collaborator unavailable";

        // System errors (700-799)
        case ErrorCode::FILE_WRITE_FAILED:
            return "File write failed";

        // Unknown/Generic errors (800+)
        case ErrorCode::UNKNOWN_ERROR:
            return "Unknown error";

        default:
            return "Unknown error code";
    }
}

const VdalignErrorCategory& vdalign_error_category() {
    static const VdalignErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return std::error_code{static_cast<int>(ec), vdalign_error_category()};
}

// Error factory functions implementation
namespace Errors {

// Configuration errors
ConfigError invalid_endpoint(const std::string& endpoint) {
    return ConfigError(ErrorCode::INVALID_ENDPOINT, "endpoints",
        "Endpoint must be a host name or 'host:port', got: '" + endpoint + "'");
}

ConfigError invalid_pattern(const std::string& field, const std::string& pattern, const std::string& reason) {
    if (pattern.empty()) {
        return ConfigError(ErrorCode::INVALID_PATTERN, field, "Pattern cannot be empty");
    }
    return ConfigError(ErrorCode::INVALID_PATTERN, field,
        "Pattern '" + pattern + "' is not a valid regular expression: " + reason);
}

ConfigError invalid_limit(const std::string& field, long long value, long long min, long long max) {
    std::ostringstream oss;
    oss << "Value must be between " << min << " and " << max << ", got: " << value;
    return ConfigError(ErrorCode::INVALID_LIMIT, field, oss.str());
}

ConfigError invalid_timeout(const std::string& field, std::chrono::milliseconds value,
                            std::chrono::milliseconds min, std::chrono::milliseconds max) {
    std::ostringstream oss;
    oss << "Timeout must be between " << min.count() << "ms and " << max.count()
        << "ms, got: " << value.count() << "ms";
    return ConfigError(ErrorCode::INVALID_TIMEOUT, field, oss.str());
}

ConfigError missing_notification(const std::string& field) {
    return ConfigError(ErrorCode::MISSING_NOTIFICATION, field,
        "Notification title and text are required when sessions are in scope");
}

ConfigError parse_failed(const std::string& source, const std::string& reason) {
    return ConfigError(ErrorCode::CONFIG_PARSE_FAILED, source, reason);
}

ConfigError file_not_found(const std::string& path) {
    return ConfigError(ErrorCode::CONFIG_FILE_NOT_FOUND, "path",
        "Cannot open configuration file: " + path);
}

// Endpoint errors
EndpointError probe_failed(const std::string& endpoint, const std::string& reason) {
    return EndpointError(ErrorCode::PROBE_FAILED, endpoint, "probe", reason);
}

EndpointError site_lookup_failed(const std::string& endpoint, const std::string& reason) {
    return EndpointError(ErrorCode::SITE_LOOKUP_FAILED, endpoint, "site_of", reason);
}

EndpointError listing_failed(const std::string& endpoint, const std::string& what, const std::string& reason) {
    return EndpointError(ErrorCode::LISTING_FAILED, endpoint, "list " + what, reason);
}

FatalError no_healthy_endpoint(size_t candidates) {
    std::ostringstream oss;
    oss << "No healthy endpoint found among " << candidates << " candidate(s)";
    return FatalError(ErrorCode::NO_HEALTHY_ENDPOINT, oss.str());
}

FatalError collaborator_unavailable(const std::string& name) {
    return FatalError(ErrorCode::COLLABORATOR_UNAVAILABLE,
        "Required collaborator '" + name + "' is not available");
}

// Query errors
QueryError query_failed(const std::string& host, const std::string& reason) {
    return QueryError(ErrorCode::QUERY_FAILED, host, reason);
}

QueryError host_unreachable(const std::string& host) {
    return QueryError(ErrorCode::HOST_UNREACHABLE, host, "Host did not respond");
}

// Action errors
ActionError restart_rejected(const std::string& machine, const std::string& reason) {
    return ActionError(ErrorCode::RESTART_REJECTED, machine, "restart", reason);
}

ActionError notification_failed(const std::string& session, const std::string& reason) {
    return ActionError(ErrorCode::NOTIFICATION_FAILED, session, "notify", reason);
}

ActionError entity_not_found(const std::string& entity, const std::string& action) {
    return ActionError(ErrorCode::ENTITY_NOT_FOUND, entity, action, "Entity no longer exists");
}

// Task errors
TaskError task_not_found(const std::string& task_id) {
    return TaskError(ErrorCode::TASK_NOT_FOUND, task_id, "Unknown task id");
}

TaskError task_poll_failed(const std::string& task_id, const std::string& reason) {
    return TaskError(ErrorCode::TASK_POLL_FAILED, task_id, reason);
}

// System errors
SystemError file_write_failed(const std::string& path) {
    return SystemError(ErrorCode::FILE_WRITE_FAILED, "Cannot write file: " + path);
}

} // namespace Errors
} // namespace vdalign
