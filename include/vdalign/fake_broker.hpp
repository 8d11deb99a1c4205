// include/vdalign/fake_broker.hpp
// Purpose: In-memory broker and disk image resolver
// Backs the tests and the fleet simulation example; fleets load from JSON fixtures

#pragma once

#include "broker.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace vdalign {

struct FakeEndpoint {
    Endpoint address;
    SiteId site;
    SubsystemStatus broker_status = SubsystemStatus::OK;
    SubsystemStatus hypervisor_status = SubsystemStatus::OK;
    bool probe_throws = false;
    bool site_lookup_fails = false;
    bool listing_fails = false;
};

struct FakeNotification {
    Endpoint endpoint;
    std::string session_key;
    std::string title;
    std::string text;
};

class FakeBroker final : public BrokerClient {
public:
    FakeBroker();

    // Fleet setup; entities belong to the site named in their site field
    void add_endpoint(FakeEndpoint endpoint);
    void add_machine(Machine machine);
    void add_session(Session session);
    void remove_machine(const std::string& machine_name);
    void remove_session(const std::string& session_key);

    void set_endpoint_health(const Endpoint& endpoint, SubsystemStatus broker, SubsystemStatus hypervisor);
    void set_machine_state(const std::string& machine_name, SummaryState state);
    void set_machine_power(const std::string& machine_name, PowerState state);
    void set_maintenance_mode(const std::string& machine_name, bool enabled);
    void set_session_state(const std::string& session_key, SessionState state);

    // State changes applied when the entity is next refreshed, i.e. after analysis
    void change_session_state_before_refresh(const std::string& session_key, SessionState state);
    void change_machine_state_before_refresh(const std::string& machine_name, SummaryState state);

    // Task states reported by successive polls; the last one repeats
    void set_task_progression(std::vector<TaskState> progression);
    void set_task_progression(const std::string& machine_name, std::vector<TaskState> progression);

    // Failure injection
    void fail_restart(const std::string& machine_name);
    void fail_notification(const std::string& session_key);
    void refuse_notification(const std::string& session_key);
    void fail_polls(bool enabled);

    // Observation
    std::vector<std::string> restarted_machines() const;
    std::vector<FakeNotification> notifications() const;
    size_t poll_count() const;
    size_t probe_count() const;
    size_t listing_count() const;

    // BrokerClient
    HealthProbe probe(const Endpoint& endpoint) override;
    std::optional<SiteId> site_of(const Endpoint& endpoint) override;
    std::vector<Machine> list_available_machines(const Endpoint& endpoint, const std::string& group_filter,
                                                 size_t max_records) override;
    std::vector<Session> list_sessions(const Endpoint& endpoint, const std::string& group_filter,
                                       size_t max_records) override;
    std::optional<Machine> refresh_machine(const Endpoint& endpoint, const std::string& machine_name) override;
    std::optional<Session> refresh_session(const Endpoint& endpoint, const std::string& session_key) override;
    TaskId submit_restart(const Endpoint& endpoint, const std::string& machine_name) override;
    bool submit_notification(const Endpoint& endpoint, const std::string& session_key,
                             const std::string& title, const std::string& text) override;
    TaskStatus poll_task(const Endpoint& endpoint, const TaskId& task_id) override;

private:
    struct FakeTask {
        Endpoint endpoint;
        std::string machine_name;
        std::vector<TaskState> progression;
        size_t polls = 0;
    };

    mutable std::mutex mu_;
    std::map<Endpoint, FakeEndpoint> endpoints_;
    std::vector<Machine> machines_;
    std::vector<Session> sessions_;
    std::map<std::string, SessionState> pending_session_changes_;
    std::map<std::string, SummaryState> pending_machine_changes_;

    std::vector<TaskState> default_progression_;
    std::map<std::string, std::vector<TaskState>> machine_progressions_;
    std::map<TaskId, FakeTask> tasks_;
    size_t next_task_ = 1;

    std::set<std::string> failing_restarts_;
    std::set<std::string> failing_notifications_;
    std::set<std::string> refused_notifications_;
    bool fail_polls_ = false;

    std::vector<std::string> restarted_;
    std::vector<FakeNotification> notifications_;
    size_t polls_ = 0;
    size_t probes_ = 0;
    size_t listings_ = 0;

    // Callers hold mu_
    const FakeEndpoint& endpoint_locked(const Endpoint& endpoint, const std::string& operation) const;
    Machine* find_machine_locked(const SiteId& site, const std::string& machine_name);
    Session* find_session_locked(const SiteId& site, const std::string& session_key);
};

class FakeDiskImageResolver final : public DiskImageResolver {
public:
    // Unknown hosts answer with no image value
    void set_image(const HostName& host, std::optional<std::string> image);
    // The host answers only after the delay, regardless of the timeout
    void set_delay(const HostName& host, std::chrono::milliseconds delay);
    void set_failure(const HostName& host, const std::string& message);

    std::optional<std::string> query_disk_image(const HostName& host,
                                                std::chrono::milliseconds timeout) override;

    size_t query_count() const;
    size_t max_concurrent_queries() const;

private:
    mutable std::mutex mu_;
    std::map<HostName, std::optional<std::string>> images_;
    std::map<HostName, std::chrono::milliseconds> delays_;
    std::map<HostName, std::string> failures_;
    size_t queries_ = 0;
    size_t in_flight_ = 0;
    size_t max_in_flight_ = 0;
};

struct FleetFixture {
    std::shared_ptr<FakeBroker> broker;
    std::shared_ptr<FakeDiskImageResolver> resolver;
};

// Builds a fake fleet from a JSON document; throws ConfigError on malformed input
FleetFixture load_fleet_fixture(const std::string& json_text);
FleetFixture load_fleet_fixture_file(const std::string& path);

} // namespace vdalign
