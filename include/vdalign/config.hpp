// include/vdalign/config.hpp
// Purpose: Run configuration for the vdalign engine
// All values are run-scoped and immutable once the run starts

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace vdalign {

// Candidate management endpoints, in preference order
struct EndpointConfig {
    std::vector<std::string> endpoints;
};

// What to look at on each site
struct SearchConfig {
    SearchScope scope = SearchScope::BOTH;
    std::string group_filter = "*";                    // Desktop group glob
    size_t max_records = 1000;                         // Per listing query
};

// Disk image version patterns (regular expressions)
struct PatternConfig {
    std::string all_versions_pattern;                  // Managed image family
    std::string target_version_pattern;                // Current version
};

// Remedial action settings
struct ActionConfig {
    size_t max_restart_actions = 10;                   // Global budget across sites
    std::chrono::minutes idle_threshold{240};          // Forced session restart threshold
    bool simulate = false;                             // Log would-be actions only
    std::string notification_title;
    std::string notification_text;
    std::optional<uint64_t> shuffle_seed;              // Fixed executor ordering
};

// Remote disk image query settings
struct QueryConfig {
    size_t concurrency_limit = 16;
    std::chrono::milliseconds timeout{30000};          // Whole batch, not per host
};

// Power action monitoring
struct MonitorConfig {
    bool run_async = false;                            // Skip monitoring entirely
    std::chrono::milliseconds power_action_timeout{600000};
    std::chrono::milliseconds poll_interval{5000};
};

struct ReportConfig {
    std::string json_report_path;                      // Empty disables JSON export
};

// Logging configuration for the engine's own diagnostics
enum class SystemLogLevel : uint8_t {
    NONE = 0,       // No logging
    ERROR = 1,      // Only errors
    WARN = 2,       // Warnings and errors
    INFO = 3,       // Informational + above
    DEBUG = 4,      // Debug + above
    TRACE = 5       // Everything
};

struct LoggingConfig {
    SystemLogLevel level = SystemLogLevel::INFO;
    bool log_to_console = true;
    std::string log_file_path;                         // Empty disables the file sink
};

// Main configuration class
class Config {
public:
    Config() = default;
    explicit Config(std::vector<std::string> endpoints);

    Config(const Config& other) = default;
    Config& operator=(const Config& other) = default;
    Config(Config&& other) noexcept = default;
    Config& operator=(Config&& other) noexcept = default;

    // Getters
    const EndpointConfig& endpoints() const noexcept { return endpoints_; }
    const SearchConfig& search() const noexcept { return search_; }
    const PatternConfig& patterns() const noexcept { return patterns_; }
    const ActionConfig& actions() const noexcept { return actions_; }
    const QueryConfig& query() const noexcept { return query_; }
    const MonitorConfig& monitor() const noexcept { return monitor_; }
    const ReportConfig& report() const noexcept { return report_; }
    const LoggingConfig& logging() const noexcept { return logging_; }

    // Setters (fluent interface)
    Config& set_endpoints(std::vector<std::string> endpoints);
    Config& add_endpoint(const std::string& endpoint);
    Config& set_search_scope(SearchScope scope);
    Config& set_group_filter(const std::string& filter);
    Config& set_max_records(size_t max_records);
    Config& set_patterns(const std::string& all_versions, const std::string& target_version);
    Config& set_max_restart_actions(size_t max_actions);
    Config& set_idle_threshold(std::chrono::minutes threshold);
    Config& set_simulate(bool simulate = true);
    Config& set_notification(const std::string& title, const std::string& text);
    Config& set_shuffle_seed(uint64_t seed);
    Config& set_concurrency_limit(size_t limit);
    Config& set_query_timeout(std::chrono::milliseconds timeout);
    Config& set_run_async(bool run_async = true);
    Config& set_power_action_timeout(std::chrono::milliseconds timeout);
    Config& set_poll_interval(std::chrono::milliseconds interval);
    Config& set_json_report_path(const std::string& path);
    Config& set_system_log_level(SystemLogLevel level);
    Config& set_log_to_file(const std::string& path);
    Config& set_log_to_console(bool enable);

    // Validation
    void validate() const;
    bool is_valid() const noexcept;
    std::vector<std::string> validation_errors() const;

    friend class ConfigBuilder;

private:
    EndpointConfig endpoints_;
    SearchConfig search_;
    PatternConfig patterns_;
    ActionConfig actions_;
    QueryConfig query_;
    MonitorConfig monitor_;
    ReportConfig report_;
    LoggingConfig logging_;

    void validate_endpoints() const;
    void validate_search_config() const;
    void validate_patterns() const;
    void validate_action_config() const;
    void validate_query_config() const;
    void validate_monitor_config() const;
};

// Configuration builder; build() validates
class ConfigBuilder {
public:
    ConfigBuilder() = default;
    explicit ConfigBuilder(std::vector<std::string> endpoints);

    ConfigBuilder& endpoints(std::vector<std::string> endpoints);
    ConfigBuilder& search(SearchScope scope, const std::string& group_filter = "*",
                          size_t max_records = 1000);
    ConfigBuilder& patterns(const std::string& all_versions, const std::string& target_version);
    ConfigBuilder& restarts(size_t max_restart_actions, std::chrono::minutes idle_threshold);
    ConfigBuilder& notification(const std::string& title, const std::string& text);
    ConfigBuilder& simulate(bool enable = true);
    ConfigBuilder& shuffle_seed(uint64_t seed);
    ConfigBuilder& query(size_t concurrency_limit, std::chrono::milliseconds timeout);
    ConfigBuilder& monitoring(std::chrono::milliseconds power_action_timeout,
                              std::chrono::milliseconds poll_interval,
                              bool run_async = false);
    ConfigBuilder& json_report(const std::string& path);
    ConfigBuilder& system_logging(SystemLogLevel level, bool console = true);
    ConfigBuilder& file_logging(const std::string& path);

    Config build() const;

private:
    Config config_;
};

// JSON configuration documents
class JsonConfig {
public:
    // Throws ConfigError on unreadable files, malformed JSON or wrongly typed keys
    static Config from_file(const std::string& path);
    static Config from_string(const std::string& text);
};

// Environment variable overrides
class EnvConfig {
public:
    // VDALIGN_ENDPOINTS, VDALIGN_SIMULATE, VDALIGN_MAX_RESTARTS, VDALIGN_LOG_LEVEL
    static Config& apply(Config& config);

    static std::optional<std::vector<std::string>> get_endpoints();
    static std::optional<bool> get_simulate();
    static std::optional<size_t> get_max_restarts();
    static std::optional<SystemLogLevel> get_log_level();

private:
    static std::optional<std::string> get_env(const std::string& name);
    static std::optional<size_t> get_env_size_t(const std::string& name);
    static std::optional<bool> get_env_bool(const std::string& name);
};

// Parse a log level name; nullopt if unrecognised
std::optional<SystemLogLevel> parse_log_level(const std::string& name);

// Configuration presets namespace
namespace Presets {

// Simulation - no power actions or notifications, verbose diagnostics
inline Config simulation(std::vector<std::string> endpoints,
                         const std::string& all_versions,
                         const std::string& target_version) {
    return ConfigBuilder(std::move(endpoints))
        .patterns(all_versions, target_version)
        .search(SearchScope::BOTH)
        .notification("Desktop update pending", "Please log off to receive the latest desktop image.")
        .simulate(true)
        .system_logging(SystemLogLevel::DEBUG)
        .build();
}

// Production - conservative restart budget, warnings and above
inline Config production(std::vector<std::string> endpoints,
                         const std::string& all_versions,
                         const std::string& target_version) {
    return ConfigBuilder(std::move(endpoints))
        .patterns(all_versions, target_version)
        .search(SearchScope::BOTH)
        .notification("Desktop update pending", "Please log off to receive the latest desktop image.")
        .restarts(25, std::chrono::hours(8))
        .query(32, std::chrono::milliseconds(60000))
        .monitoring(std::chrono::minutes(15), std::chrono::seconds(5))
        .system_logging(SystemLogLevel::WARN)
        .build();
}

} // namespace Presets

} // namespace vdalign
