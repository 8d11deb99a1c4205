// include/vdalign/broker.hpp
// Purpose: Abstract collaborators used by the engine
// The desktop broker management API and the per-host disk image query

#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace vdalign {

// Management API of a virtual desktop broker, addressed per endpoint.
// Implementations report failures by throwing vdalign::Error subclasses;
// the engine treats every such failure as recoverable.
class BrokerClient {
public:
    virtual ~BrokerClient() = default;

    // Health of the broker and hypervisor subsystems behind an endpoint
    virtual HealthProbe probe(const Endpoint& endpoint) = 0;

    // Site identity served by the endpoint; nullopt if it cannot tell
    virtual std::optional<SiteId> site_of(const Endpoint& endpoint) = 0;

    // Entity listing, filtered by desktop group glob
    virtual std::vector<Machine> list_available_machines(const Endpoint& endpoint,
                                                         const std::string& group_filter,
                                                         size_t max_records) = 0;
    virtual std::vector<Session> list_sessions(const Endpoint& endpoint,
                                               const std::string& group_filter,
                                               size_t max_records) = 0;

    // Live state, nullopt once the entity no longer exists
    virtual std::optional<Machine> refresh_machine(const Endpoint& endpoint,
                                                   const std::string& machine_name) = 0;
    virtual std::optional<Session> refresh_session(const Endpoint& endpoint,
                                                   const std::string& session_key) = 0;

    // Actions
    virtual TaskId submit_restart(const Endpoint& endpoint, const std::string& machine_name) = 0;
    virtual bool submit_notification(const Endpoint& endpoint, const std::string& session_key,
                                     const std::string& title, const std::string& text) = 0;

    virtual TaskStatus poll_task(const Endpoint& endpoint, const TaskId& task_id) = 0;
};

// Resolves the disk image a host is currently running.
// Called concurrently from the query pool; implementations must be thread-safe.
class DiskImageResolver {
public:
    virtual ~DiskImageResolver() = default;

    // nullopt when the host has no image value or did not answer in time
    virtual std::optional<std::string> query_disk_image(const HostName& host,
                                                        std::chrono::milliseconds timeout) = 0;
};

} // namespace vdalign
