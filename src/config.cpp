// src/config.cpp
// Implementation of configuration system with validation, JSON and environment sources

#include "vdalign/config.hpp"
#include "vdalign/utils.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <cctype>

namespace vdalign {

namespace {

constexpr size_t MAX_RECORDS_LIMIT = 100000;
constexpr size_t MAX_CONCURRENCY_LIMIT = 256;
constexpr size_t MAX_RESTART_ACTIONS_LIMIT = 10000;

const std::chrono::milliseconds MIN_QUERY_TIMEOUT{100};
const std::chrono::milliseconds MAX_QUERY_TIMEOUT = std::chrono::hours(1);
const std::chrono::milliseconds MIN_POWER_TIMEOUT = std::chrono::seconds(1);
const std::chrono::milliseconds MAX_POWER_TIMEOUT = std::chrono::hours(24);
const std::chrono::milliseconds MIN_POLL_INTERVAL{10};
const std::chrono::milliseconds MAX_POLL_INTERVAL = std::chrono::minutes(5);

} // namespace

// Config implementation
Config::Config(std::vector<std::string> endpoints) {
    endpoints_.endpoints = std::move(endpoints);
}

Config& Config::set_endpoints(std::vector<std::string> endpoints) {
    endpoints_.endpoints = std::move(endpoints);
    return *this;
}

Config& Config::add_endpoint(const std::string& endpoint) {
    endpoints_.endpoints.push_back(endpoint);
    return *this;
}

Config& Config::set_search_scope(SearchScope scope) {
    search_.scope = scope;
    return *this;
}

Config& Config::set_group_filter(const std::string& filter) {
    search_.group_filter = filter;
    return *this;
}

Config& Config::set_max_records(size_t max_records) {
    search_.max_records = max_records;
    return *this;
}

Config& Config::set_patterns(const std::string& all_versions, const std::string& target_version) {
    patterns_.all_versions_pattern = all_versions;
    patterns_.target_version_pattern = target_version;
    return *this;
}

Config& Config::set_max_restart_actions(size_t max_actions) {
    actions_.max_restart_actions = max_actions;
    return *this;
}

Config& Config::set_idle_threshold(std::chrono::minutes threshold) {
    actions_.idle_threshold = threshold;
    return *this;
}

Config& Config::set_simulate(bool simulate) {
    actions_.simulate = simulate;
    return *this;
}

Config& Config::set_notification(const std::string& title, const std::string& text) {
    actions_.notification_title = title;
    actions_.notification_text = text;
    return *this;
}

Config& Config::set_shuffle_seed(uint64_t seed) {
    actions_.shuffle_seed = seed;
    return *this;
}

Config& Config::set_concurrency_limit(size_t limit) {
    query_.concurrency_limit = limit;
    return *this;
}

Config& Config::set_query_timeout(std::chrono::milliseconds timeout) {
    query_.timeout = timeout;
    return *this;
}

Config& Config::set_run_async(bool run_async) {
    monitor_.run_async = run_async;
    return *this;
}

Config& Config::set_power_action_timeout(std::chrono::milliseconds timeout) {
    monitor_.power_action_timeout = timeout;
    return *this;
}

Config& Config::set_poll_interval(std::chrono::milliseconds interval) {
    monitor_.poll_interval = interval;
    return *this;
}

Config& Config::set_json_report_path(const std::string& path) {
    report_.json_report_path = path;
    return *this;
}

Config& Config::set_system_log_level(SystemLogLevel level) {
    logging_.level = level;
    return *this;
}

Config& Config::set_log_to_file(const std::string& path) {
    logging_.log_file_path = path;
    return *this;
}

Config& Config::set_log_to_console(bool enable) {
    logging_.log_to_console = enable;
    return *this;
}

void Config::validate() const {
    std::vector<std::string> errors = validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Configuration validation failed:\n";
        for (const auto& error : errors) {
            oss << "  - " << error << "\n";
        }
        throw ConfigError(ErrorCode::INVALID_CONFIG, "config", oss.str());
    }
}

bool Config::is_valid() const noexcept {
    try {
        return validation_errors().empty();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> Config::validation_errors() const {
    std::vector<std::string> errors;

    try {
        validate_endpoints();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_search_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_patterns();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_action_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_query_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_monitor_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    return errors;
}

void Config::validate_endpoints() const {
    if (endpoints_.endpoints.empty()) {
        throw ConfigError(ErrorCode::INVALID_ENDPOINT, "endpoints",
            "At least one endpoint is required");
    }
    for (const auto& endpoint : endpoints_.endpoints) {
        if (!Utils::is_valid_endpoint(endpoint)) {
            throw Errors::invalid_endpoint(endpoint);
        }
    }
}

void Config::validate_search_config() const {
    if (search_.max_records == 0 || search_.max_records > MAX_RECORDS_LIMIT) {
        throw Errors::invalid_limit("max_records", static_cast<long long>(search_.max_records),
                                    1, static_cast<long long>(MAX_RECORDS_LIMIT));
    }
    if (Utils::trim(search_.group_filter).empty()) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "group_filter",
            "Desktop group filter cannot be empty, use '*' to match every group");
    }
}

void Config::validate_patterns() const {
    std::string reason;
    if (!Utils::is_valid_regex(patterns_.all_versions_pattern, &reason)) {
        throw Errors::invalid_pattern("all_versions_pattern", patterns_.all_versions_pattern, reason);
    }
    if (!Utils::is_valid_regex(patterns_.target_version_pattern, &reason)) {
        throw Errors::invalid_pattern("target_version_pattern", patterns_.target_version_pattern, reason);
    }
}

void Config::validate_action_config() const {
    // A zero budget is valid and disables restarts
    if (actions_.max_restart_actions > MAX_RESTART_ACTIONS_LIMIT) {
        throw Errors::invalid_limit("max_restart_actions", static_cast<long long>(actions_.max_restart_actions),
                                    0, static_cast<long long>(MAX_RESTART_ACTIONS_LIMIT));
    }
    if (actions_.idle_threshold.count() < 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "idle_threshold",
            "Idle threshold cannot be negative");
    }
    if (Utils::scope_includes_sessions(search_.scope)) {
        if (Utils::trim(actions_.notification_title).empty()) {
            throw Errors::missing_notification("notification_title");
        }
        if (Utils::trim(actions_.notification_text).empty()) {
            throw Errors::missing_notification("notification_text");
        }
    }
}

void Config::validate_query_config() const {
    if (query_.concurrency_limit == 0 || query_.concurrency_limit > MAX_CONCURRENCY_LIMIT) {
        throw Errors::invalid_limit("concurrency_limit", static_cast<long long>(query_.concurrency_limit),
                                    1, static_cast<long long>(MAX_CONCURRENCY_LIMIT));
    }
    if (query_.timeout < MIN_QUERY_TIMEOUT || query_.timeout > MAX_QUERY_TIMEOUT) {
        throw Errors::invalid_timeout("query_timeout", query_.timeout, MIN_QUERY_TIMEOUT, MAX_QUERY_TIMEOUT);
    }
}

void Config::validate_monitor_config() const {
    if (monitor_.power_action_timeout < MIN_POWER_TIMEOUT ||
        monitor_.power_action_timeout > MAX_POWER_TIMEOUT) {
        throw Errors::invalid_timeout("power_action_timeout", monitor_.power_action_timeout,
                                      MIN_POWER_TIMEOUT, MAX_POWER_TIMEOUT);
    }
    if (monitor_.poll_interval < MIN_POLL_INTERVAL || monitor_.poll_interval > MAX_POLL_INTERVAL) {
        throw Errors::invalid_timeout("poll_interval", monitor_.poll_interval,
                                      MIN_POLL_INTERVAL, MAX_POLL_INTERVAL);
    }
    if (monitor_.poll_interval > monitor_.power_action_timeout) {
        throw ConfigError(ErrorCode::INVALID_TIMEOUT, "poll_interval",
            "Poll interval cannot exceed the power action timeout");
    }
}

// ConfigBuilder implementation
ConfigBuilder::ConfigBuilder(std::vector<std::string> endpoints) : config_(std::move(endpoints)) {}

ConfigBuilder& ConfigBuilder::endpoints(std::vector<std::string> endpoints) {
    config_.endpoints_.endpoints = std::move(endpoints);
    return *this;
}

ConfigBuilder& ConfigBuilder::search(SearchScope scope, const std::string& group_filter,
                                     size_t max_records) {
    config_.search_.scope = scope;
    config_.search_.group_filter = group_filter;
    config_.search_.max_records = max_records;
    return *this;
}

ConfigBuilder& ConfigBuilder::patterns(const std::string& all_versions, const std::string& target_version) {
    config_.patterns_.all_versions_pattern = all_versions;
    config_.patterns_.target_version_pattern = target_version;
    return *this;
}

ConfigBuilder& ConfigBuilder::restarts(size_t max_restart_actions, std::chrono::minutes idle_threshold) {
    config_.actions_.max_restart_actions = max_restart_actions;
    config_.actions_.idle_threshold = idle_threshold;
    return *this;
}

ConfigBuilder& ConfigBuilder::notification(const std::string& title, const std::string& text) {
    config_.actions_.notification_title = title;
    config_.actions_.notification_text = text;
    return *this;
}

ConfigBuilder& ConfigBuilder::simulate(bool enable) {
    config_.actions_.simulate = enable;
    return *this;
}

ConfigBuilder& ConfigBuilder::shuffle_seed(uint64_t seed) {
    config_.actions_.shuffle_seed = seed;
    return *this;
}

ConfigBuilder& ConfigBuilder::query(size_t concurrency_limit, std::chrono::milliseconds timeout) {
    config_.query_.concurrency_limit = concurrency_limit;
    config_.query_.timeout = timeout;
    return *this;
}

ConfigBuilder& ConfigBuilder::monitoring(std::chrono::milliseconds power_action_timeout,
                                         std::chrono::milliseconds poll_interval,
                                         bool run_async) {
    config_.monitor_.power_action_timeout = power_action_timeout;
    config_.monitor_.poll_interval = poll_interval;
    config_.monitor_.run_async = run_async;
    return *this;
}

ConfigBuilder& ConfigBuilder::json_report(const std::string& path) {
    config_.report_.json_report_path = path;
    return *this;
}

ConfigBuilder& ConfigBuilder::system_logging(SystemLogLevel level, bool console) {
    config_.logging_.level = level;
    config_.logging_.log_to_console = console;
    return *this;
}

ConfigBuilder& ConfigBuilder::file_logging(const std::string& path) {
    config_.logging_.log_file_path = path;
    return *this;
}

Config ConfigBuilder::build() const {
    Config config = config_;
    config.validate(); // Ensure the built config is valid
    return config;
}

// JsonConfig implementation
namespace {

template <typename T>
std::optional<T> read_field(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw Errors::parse_failed(key, e.what());
    }
}

// Counts are read signed so that a negative value is rejected instead of wrapping
std::optional<size_t> read_count(const nlohmann::json& doc, const char* key) {
    auto value = read_field<long long>(doc, key);
    if (!value) {
        return std::nullopt;
    }
    if (*value < 0) {
        throw Errors::parse_failed(key, "Value cannot be negative, got: " + std::to_string(*value));
    }
    return static_cast<size_t>(*value);
}

std::chrono::milliseconds read_millis(const nlohmann::json& doc, const char* key,
                                      std::chrono::milliseconds fallback) {
    if (auto value = read_field<long long>(doc, key)) {
        return std::chrono::milliseconds(*value);
    }
    return fallback;
}

} // namespace

Config JsonConfig::from_file(const std::string& path) {
    if (!Utils::file_exists(path)) {
        throw Errors::file_not_found(path);
    }
    return from_string(Utils::read_file_contents(path));
}

Config JsonConfig::from_string(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw Errors::parse_failed("json", e.what());
    }
    if (!doc.is_object()) {
        throw Errors::parse_failed("json", "Top-level JSON value must be an object");
    }

    Config config;

    if (auto endpoints = read_field<std::vector<std::string>>(doc, "endpoints")) {
        config.set_endpoints(*endpoints);
    }

    if (auto scope_name = read_field<std::string>(doc, "search_scope")) {
        auto scope = Utils::string_to_search_scope(*scope_name);
        if (!scope) {
            throw Errors::parse_failed("search_scope", "Unrecognised search scope '" + *scope_name + "'");
        }
        config.set_search_scope(*scope);
    }
    if (auto filter = read_field<std::string>(doc, "group_filter")) {
        config.set_group_filter(*filter);
    }
    if (auto max_records = read_count(doc, "max_records")) {
        config.set_max_records(*max_records);
    }

    config.set_patterns(read_field<std::string>(doc, "all_versions_pattern").value_or(""),
                        read_field<std::string>(doc, "target_version_pattern").value_or(""));

    if (auto max_restarts = read_count(doc, "max_restart_actions")) {
        config.set_max_restart_actions(*max_restarts);
    }
    if (auto idle_hours = read_field<double>(doc, "idle_hours")) {
        config.set_idle_threshold(std::chrono::minutes(static_cast<long long>(std::llround(*idle_hours * 60.0))));
    }
    if (auto simulate = read_field<bool>(doc, "simulate")) {
        config.set_simulate(*simulate);
    }
    config.set_notification(read_field<std::string>(doc, "notification_title").value_or(""),
                            read_field<std::string>(doc, "notification_text").value_or(""));
    if (auto seed = read_field<uint64_t>(doc, "shuffle_seed")) {
        config.set_shuffle_seed(*seed);
    }

    if (auto limit = read_count(doc, "concurrency_limit")) {
        config.set_concurrency_limit(*limit);
    }
    config.set_query_timeout(read_millis(doc, "query_timeout_ms", config.query().timeout));

    if (auto run_async = read_field<bool>(doc, "run_async")) {
        config.set_run_async(*run_async);
    }
    config.set_power_action_timeout(read_millis(doc, "power_action_timeout_ms",
                                                config.monitor().power_action_timeout));
    config.set_poll_interval(read_millis(doc, "poll_interval_ms", config.monitor().poll_interval));

    if (auto report_path = read_field<std::string>(doc, "json_report_path")) {
        config.set_json_report_path(*report_path);
    }

    if (auto level_name = read_field<std::string>(doc, "log_level")) {
        auto level = parse_log_level(*level_name);
        if (!level) {
            throw Errors::parse_failed("log_level", "Unrecognised log level '" + *level_name + "'");
        }
        config.set_system_log_level(*level);
    }
    if (auto log_file = read_field<std::string>(doc, "log_file")) {
        config.set_log_to_file(*log_file);
    }

    return config;
}

// EnvConfig implementation
Config& EnvConfig::apply(Config& config) {
    if (auto endpoints = get_endpoints()) {
        config.set_endpoints(*endpoints);
    }

    if (auto simulate = get_simulate()) {
        config.set_simulate(*simulate);
    }

    if (auto max_restarts = get_max_restarts()) {
        config.set_max_restart_actions(*max_restarts);
    }

    if (auto log_level = get_log_level()) {
        config.set_system_log_level(*log_level);
    }

    return config;
}

std::optional<std::vector<std::string>> EnvConfig::get_endpoints() {
    if (auto value = get_env("VDALIGN_ENDPOINTS")) {
        std::vector<std::string> endpoints;
        for (const auto& part : Utils::split(*value, ',')) {
            std::string endpoint = Utils::trim(part);
            if (!endpoint.empty()) {
                endpoints.push_back(endpoint);
            }
        }
        if (!endpoints.empty()) {
            return endpoints;
        }
    }
    return std::nullopt;
}

std::optional<bool> EnvConfig::get_simulate() {
    return get_env_bool("VDALIGN_SIMULATE");
}

std::optional<size_t> EnvConfig::get_max_restarts() {
    return get_env_size_t("VDALIGN_MAX_RESTARTS");
}

std::optional<SystemLogLevel> EnvConfig::get_log_level() {
    if (auto level_str = get_env("VDALIGN_LOG_LEVEL")) {
        return parse_log_level(*level_str);
    }
    return std::nullopt;
}

std::optional<std::string> EnvConfig::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && std::strlen(value) > 0) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<size_t> EnvConfig::get_env_size_t(const std::string& name) {
    if (auto str = get_env(name)) {
        std::string digits = Utils::trim(*str);
        // std::stoull accepts a leading minus and wraps it
        if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits.front()))) {
            return std::nullopt;
        }
        try {
            size_t consumed = 0;
            unsigned long long value = std::stoull(digits, &consumed);
            if (consumed != digits.size()) {
                return std::nullopt;
            }
            return static_cast<size_t>(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> EnvConfig::get_env_bool(const std::string& name) {
    if (auto str = get_env(name)) {
        std::string lower = Utils::to_lower(*str);
        return (lower == "true" || lower == "1" || lower == "yes" || lower == "on");
    }
    return std::nullopt;
}

std::optional<SystemLogLevel> parse_log_level(const std::string& name) {
    std::string upper = Utils::to_upper(Utils::trim(name));

    if (upper == "NONE") return SystemLogLevel::NONE;
    if (upper == "ERROR") return SystemLogLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return SystemLogLevel::WARN;
    if (upper == "INFO") return SystemLogLevel::INFO;
    if (upper == "DEBUG") return SystemLogLevel::DEBUG;
    if (upper == "TRACE") return SystemLogLevel::TRACE;
    return std::nullopt;
}

} // namespace vdalign
