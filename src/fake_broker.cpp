// src/fake_broker.cpp
// Implementation of the in-memory broker, resolver and fleet fixtures

#include "vdalign/fake_broker.hpp"
#include "vdalign/errors.hpp"
#include "vdalign/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <thread>

namespace vdalign {

// FakeBroker implementation
FakeBroker::FakeBroker()
    : default_progression_{TaskState::STARTED, TaskState::COMPLETED} {}

void FakeBroker::add_endpoint(FakeEndpoint endpoint) {
    std::lock_guard<std::mutex> lock(mu_);
    Endpoint address = endpoint.address;
    endpoints_[address] = std::move(endpoint);
}

void FakeBroker::add_machine(Machine machine) {
    std::lock_guard<std::mutex> lock(mu_);
    machines_.push_back(std::move(machine));
}

void FakeBroker::add_session(Session session) {
    std::lock_guard<std::mutex> lock(mu_);
    sessions_.push_back(std::move(session));
}

void FakeBroker::remove_machine(const std::string& machine_name) {
    std::lock_guard<std::mutex> lock(mu_);
    machines_.erase(std::remove_if(machines_.begin(), machines_.end(),
                                   [&](const Machine& m) { return m.machine_name == machine_name; }),
                    machines_.end());
}

void FakeBroker::remove_session(const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mu_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [&](const Session& s) { return s.session_key == session_key; }),
                    sessions_.end());
}

void FakeBroker::set_endpoint_health(const Endpoint& endpoint, SubsystemStatus broker,
                                     SubsystemStatus hypervisor) {
    std::lock_guard<std::mutex> lock(mu_);
    auto& entry = endpoints_[endpoint];
    entry.address = endpoint;
    entry.broker_status = broker;
    entry.hypervisor_status = hypervisor;
}

void FakeBroker::set_machine_state(const std::string& machine_name, SummaryState state) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& machine : machines_) {
        if (machine.machine_name == machine_name) {
            machine.summary_state = state;
        }
    }
}

void FakeBroker::set_machine_power(const std::string& machine_name, PowerState state) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& machine : machines_) {
        if (machine.machine_name == machine_name) {
            machine.power_state = state;
        }
    }
}

void FakeBroker::set_maintenance_mode(const std::string& machine_name, bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& machine : machines_) {
        if (machine.machine_name == machine_name) {
            machine.in_maintenance_mode = enabled;
        }
    }
}

void FakeBroker::set_session_state(const std::string& session_key, SessionState state) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& session : sessions_) {
        if (session.session_key == session_key) {
            session.state = state;
            session.state_change_time = std::chrono::system_clock::now();
        }
    }
}

void FakeBroker::change_session_state_before_refresh(const std::string& session_key, SessionState state) {
    std::lock_guard<std::mutex> lock(mu_);
    pending_session_changes_[session_key] = state;
}

void FakeBroker::change_machine_state_before_refresh(const std::string& machine_name, SummaryState state) {
    std::lock_guard<std::mutex> lock(mu_);
    pending_machine_changes_[machine_name] = state;
}

void FakeBroker::set_task_progression(std::vector<TaskState> progression) {
    std::lock_guard<std::mutex> lock(mu_);
    default_progression_ = std::move(progression);
}

void FakeBroker::set_task_progression(const std::string& machine_name, std::vector<TaskState> progression) {
    std::lock_guard<std::mutex> lock(mu_);
    machine_progressions_[machine_name] = std::move(progression);
}

void FakeBroker::fail_restart(const std::string& machine_name) {
    std::lock_guard<std::mutex> lock(mu_);
    failing_restarts_.insert(machine_name);
}

void FakeBroker::fail_notification(const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mu_);
    failing_notifications_.insert(session_key);
}

void FakeBroker::refuse_notification(const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mu_);
    refused_notifications_.insert(session_key);
}

void FakeBroker::fail_polls(bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_polls_ = enabled;
}

std::vector<std::string> FakeBroker::restarted_machines() const {
    std::lock_guard<std::mutex> lock(mu_);
    return restarted_;
}

std::vector<FakeNotification> FakeBroker::notifications() const {
    std::lock_guard<std::mutex> lock(mu_);
    return notifications_;
}

size_t FakeBroker::poll_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return polls_;
}

size_t FakeBroker::probe_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return probes_;
}

size_t FakeBroker::listing_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return listings_;
}

HealthProbe FakeBroker::probe(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(mu_);
    ++probes_;
    auto it = endpoints_.find(endpoint);
    if (it == endpoints_.end()) {
        return HealthProbe{SubsystemStatus::OFFLINE, SubsystemStatus::OFFLINE};
    }
    if (it->second.probe_throws) {
        throw EndpointError(ErrorCode::ENDPOINT_UNREACHABLE, endpoint, "probe", "Connection refused");
    }
    return HealthProbe{it->second.broker_status, it->second.hypervisor_status};
}

std::optional<SiteId> FakeBroker::site_of(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(mu_);
    const FakeEndpoint& entry = endpoint_locked(endpoint, "site_of");
    if (entry.site_lookup_fails) {
        throw Errors::site_lookup_failed(endpoint, "Site query rejected");
    }
    if (entry.site.empty()) {
        return std::nullopt;
    }
    return entry.site;
}

std::vector<Machine> FakeBroker::list_available_machines(const Endpoint& endpoint,
                                                         const std::string& group_filter,
                                                         size_t max_records) {
    std::lock_guard<std::mutex> lock(mu_);
    ++listings_;
    const FakeEndpoint& entry = endpoint_locked(endpoint, "list machines");
    if (entry.listing_fails) {
        throw Errors::listing_failed(endpoint, "available machines", "Listing rejected");
    }

    std::vector<Machine> result;
    for (const auto& machine : machines_) {
        if (result.size() >= max_records) {
            break;
        }
        if (machine.site != entry.site ||
            !Utils::glob_match(group_filter, machine.desktop_group) ||
            machine.summary_state != SummaryState::AVAILABLE ||
            machine.in_maintenance_mode) {
            continue;
        }
        Machine listed = machine;
        listed.endpoint = endpoint;
        listed.disk_image = std::nullopt;
        result.push_back(std::move(listed));
    }
    return result;
}

std::vector<Session> FakeBroker::list_sessions(const Endpoint& endpoint, const std::string& group_filter,
                                               size_t max_records) {
    std::lock_guard<std::mutex> lock(mu_);
    ++listings_;
    const FakeEndpoint& entry = endpoint_locked(endpoint, "list sessions");
    if (entry.listing_fails) {
        throw Errors::listing_failed(endpoint, "sessions", "Listing rejected");
    }

    std::vector<Session> result;
    for (const auto& session : sessions_) {
        if (result.size() >= max_records) {
            break;
        }
        if (session.site != entry.site || !Utils::glob_match(group_filter, session.desktop_group)) {
            continue;
        }
        Session listed = session;
        listed.endpoint = endpoint;
        listed.disk_image = std::nullopt;
        result.push_back(std::move(listed));
    }
    return result;
}

std::optional<Machine> FakeBroker::refresh_machine(const Endpoint& endpoint, const std::string& machine_name) {
    std::lock_guard<std::mutex> lock(mu_);
    const FakeEndpoint& entry = endpoint_locked(endpoint, "refresh machine");

    auto change = pending_machine_changes_.find(machine_name);
    if (change != pending_machine_changes_.end()) {
        for (auto& machine : machines_) {
            if (machine.machine_name == machine_name) {
                machine.summary_state = change->second;
            }
        }
        pending_machine_changes_.erase(change);
    }

    Machine* machine = find_machine_locked(entry.site, machine_name);
    if (!machine) {
        return std::nullopt;
    }
    Machine live = *machine;
    live.endpoint = endpoint;
    return live;
}

std::optional<Session> FakeBroker::refresh_session(const Endpoint& endpoint, const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mu_);
    const FakeEndpoint& entry = endpoint_locked(endpoint, "refresh session");

    auto change = pending_session_changes_.find(session_key);
    if (change != pending_session_changes_.end()) {
        for (auto& session : sessions_) {
            if (session.session_key == session_key) {
                session.state = change->second;
                session.state_change_time = std::chrono::system_clock::now();
            }
        }
        pending_session_changes_.erase(change);
    }

    Session* session = find_session_locked(entry.site, session_key);
    if (!session) {
        return std::nullopt;
    }
    Session live = *session;
    live.endpoint = endpoint;
    return live;
}

TaskId FakeBroker::submit_restart(const Endpoint& endpoint, const std::string& machine_name) {
    std::lock_guard<std::mutex> lock(mu_);
    const FakeEndpoint& entry = endpoint_locked(endpoint, "restart");
    if (failing_restarts_.count(machine_name) > 0) {
        throw Errors::restart_rejected(machine_name, "Power action refused by hypervisor");
    }
    if (!find_machine_locked(entry.site, machine_name)) {
        throw Errors::entity_not_found(machine_name, "restart");
    }

    TaskId task_id = "task-" + std::to_string(next_task_++);
    FakeTask task;
    task.endpoint = endpoint;
    task.machine_name = machine_name;
    auto custom = machine_progressions_.find(machine_name);
    task.progression = custom != machine_progressions_.end() ? custom->second : default_progression_;
    tasks_[task_id] = std::move(task);
    restarted_.push_back(machine_name);
    return task_id;
}

bool FakeBroker::submit_notification(const Endpoint& endpoint, const std::string& session_key,
                                     const std::string& title, const std::string& text) {
    std::lock_guard<std::mutex> lock(mu_);
    const FakeEndpoint& entry = endpoint_locked(endpoint, "notify");
    if (failing_notifications_.count(session_key) > 0) {
        throw Errors::notification_failed(session_key, "Message service unavailable");
    }
    if (refused_notifications_.count(session_key) > 0 || !find_session_locked(entry.site, session_key)) {
        return false;
    }
    notifications_.push_back(FakeNotification{endpoint, session_key, title, text});
    return true;
}

TaskStatus FakeBroker::poll_task(const Endpoint& endpoint, const TaskId& task_id) {
    std::lock_guard<std::mutex> lock(mu_);
    ++polls_;
    if (fail_polls_) {
        throw Errors::task_poll_failed(task_id, "Endpoint " + endpoint + " did not answer");
    }
    auto it = tasks_.find(task_id);
    if (it == tasks_.end() || it->second.endpoint != endpoint) {
        throw Errors::task_not_found(task_id);
    }

    FakeTask& task = it->second;
    TaskStatus status;
    if (!task.progression.empty()) {
        size_t index = std::min(task.polls, task.progression.size() - 1);
        status.state = task.progression[index];
    }
    ++task.polls;
    if (status.is_terminal()) {
        status.completion_time = std::chrono::system_clock::now();
    }
    return status;
}

const FakeEndpoint& FakeBroker::endpoint_locked(const Endpoint& endpoint, const std::string& operation) const {
    auto it = endpoints_.find(endpoint);
    if (it == endpoints_.end()) {
        throw EndpointError(ErrorCode::ENDPOINT_UNREACHABLE, endpoint, operation, "Unknown endpoint");
    }
    return it->second;
}

Machine* FakeBroker::find_machine_locked(const SiteId& site, const std::string& machine_name) {
    for (auto& machine : machines_) {
        if (machine.site == site && machine.machine_name == machine_name) {
            return &machine;
        }
    }
    return nullptr;
}

Session* FakeBroker::find_session_locked(const SiteId& site, const std::string& session_key) {
    for (auto& session : sessions_) {
        if (session.site == site && session.session_key == session_key) {
            return &session;
        }
    }
    return nullptr;
}

// FakeDiskImageResolver implementation
void FakeDiskImageResolver::set_image(const HostName& host, std::optional<std::string> image) {
    std::lock_guard<std::mutex> lock(mu_);
    images_[host] = std::move(image);
}

void FakeDiskImageResolver::set_delay(const HostName& host, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mu_);
    delays_[host] = delay;
}

void FakeDiskImageResolver::set_failure(const HostName& host, const std::string& message) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_[host] = message;
}

std::optional<std::string> FakeDiskImageResolver::query_disk_image(const HostName& host,
                                                                   std::chrono::milliseconds /*timeout*/) {
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mu_);
        ++queries_;
        ++in_flight_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        auto it = delays_.find(host);
        if (it != delays_.end()) {
            delay = it->second;
        }
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    } else {
        // Keep concurrent queries overlapping long enough to be observed
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    std::lock_guard<std::mutex> lock(mu_);
    --in_flight_;
    auto failure = failures_.find(host);
    if (failure != failures_.end()) {
        throw Errors::host_unreachable(host + " (" + failure->second + ")");
    }
    auto image = images_.find(host);
    if (image == images_.end()) {
        return std::nullopt;
    }
    return image->second;
}

size_t FakeDiskImageResolver::query_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queries_;
}

size_t FakeDiskImageResolver::max_concurrent_queries() const {
    std::lock_guard<std::mutex> lock(mu_);
    return max_in_flight_;
}

// Fleet fixtures
namespace {

template <typename Enum>
Enum parse_enum(const nlohmann::json& value, std::optional<Enum> (*parser)(const std::string&),
                const std::string& field, Enum fallback) {
    if (value.is_null()) {
        return fallback;
    }
    std::string text = value.get<std::string>();
    auto parsed = parser(text);
    if (!parsed) {
        throw Errors::parse_failed("fleet fixture", "Unrecognised " + field + " '" + text + "'");
    }
    return *parsed;
}

std::vector<TaskState> parse_progression(const nlohmann::json& list) {
    std::vector<TaskState> progression;
    for (const auto& item : list) {
        progression.push_back(parse_enum<TaskState>(item, &Utils::string_to_task_state, "task state",
                                                    TaskState::PENDING));
    }
    return progression;
}

void load_image(FakeDiskImageResolver& resolver, const nlohmann::json& item, const HostName& host) {
    auto image = item.find("image");
    if (image == item.end()) {
        return;
    }
    if (image->is_null()) {
        resolver.set_image(host, std::nullopt);
    } else {
        resolver.set_image(host, image->get<std::string>());
    }
}

} // namespace

FleetFixture load_fleet_fixture(const std::string& json_text) {
    FleetFixture fixture;
    fixture.broker = std::make_shared<FakeBroker>();
    fixture.resolver = std::make_shared<FakeDiskImageResolver>();

    try {
        auto doc = nlohmann::json::parse(json_text);
        auto now = std::chrono::system_clock::now();

        for (const auto& item : doc.value("endpoints", nlohmann::json::array())) {
            FakeEndpoint endpoint;
            endpoint.address = item.at("address").get<std::string>();
            endpoint.site = item.value("site", std::string());
            endpoint.broker_status = parse_enum<SubsystemStatus>(item.value("broker", nlohmann::json()),
                &Utils::string_to_subsystem_status, "broker status", SubsystemStatus::OK);
            endpoint.hypervisor_status = parse_enum<SubsystemStatus>(item.value("hypervisor", nlohmann::json()),
                &Utils::string_to_subsystem_status, "hypervisor status", SubsystemStatus::OK);
            endpoint.probe_throws = item.value("probe_throws", false);
            endpoint.site_lookup_fails = item.value("site_lookup_fails", false);
            endpoint.listing_fails = item.value("listing_fails", false);
            fixture.broker->add_endpoint(std::move(endpoint));
        }

        for (const auto& item : doc.value("machines", nlohmann::json::array())) {
            Machine machine;
            machine.machine_name = item.at("name").get<std::string>();
            machine.dns_name = item.value("dns_name", std::string());
            machine.desktop_group = item.value("group", std::string());
            machine.site = item.at("site").get<std::string>();
            machine.summary_state = parse_enum<SummaryState>(item.value("state", nlohmann::json()),
                &Utils::string_to_summary_state, "machine state", SummaryState::AVAILABLE);
            machine.power_state = parse_enum<PowerState>(item.value("power", nlohmann::json()),
                &Utils::string_to_power_state, "power state", PowerState::ON);
            machine.in_maintenance_mode = item.value("maintenance", false);

            HostName host = machine.dns_name.empty() ? machine.machine_name : machine.dns_name;
            load_image(*fixture.resolver, item, host);
            if (item.contains("query_delay_ms")) {
                fixture.resolver->set_delay(host, std::chrono::milliseconds(item.at("query_delay_ms").get<long long>()));
            }
            if (item.contains("fail_restart") && item.at("fail_restart").get<bool>()) {
                fixture.broker->fail_restart(machine.machine_name);
            }
            if (item.contains("task_progression")) {
                fixture.broker->set_task_progression(machine.machine_name,
                                                     parse_progression(item.at("task_progression")));
            }
            fixture.broker->add_machine(std::move(machine));
        }

        for (const auto& item : doc.value("sessions", nlohmann::json::array())) {
            Session session;
            session.session_key = item.at("key").get<std::string>();
            session.machine_name = item.at("machine").get<std::string>();
            session.dns_name = item.value("dns_name", std::string());
            session.user_name = item.value("user", std::string());
            session.desktop_group = item.value("group", std::string());
            session.site = item.at("site").get<std::string>();
            session.state = parse_enum<SessionState>(item.value("state", nlohmann::json()),
                &Utils::string_to_session_state, "session state", SessionState::ACTIVE);
            session.state_change_time = now - std::chrono::minutes(item.value("idle_minutes", 0LL));

            HostName host = session.dns_name.empty() ? session.machine_name : session.dns_name;
            load_image(*fixture.resolver, item, host);
            if (item.contains("query_delay_ms")) {
                fixture.resolver->set_delay(host, std::chrono::milliseconds(item.at("query_delay_ms").get<long long>()));
            }
            fixture.broker->add_session(std::move(session));
        }

        if (doc.contains("task_progression")) {
            fixture.broker->set_task_progression(parse_progression(doc.at("task_progression")));
        }
    } catch (const nlohmann::json::exception& e) {
        throw Errors::parse_failed("fleet fixture", e.what());
    }

    return fixture;
}

FleetFixture load_fleet_fixture_file(const std::string& path) {
    if (!Utils::file_exists(path)) {
        throw Errors::file_not_found(path);
    }
    return load_fleet_fixture(Utils::read_file_contents(path));
}

} // namespace vdalign
