// include/vdalign/types.hpp
// Purpose: Core types, enums and records for the vdalign fleet alignment engine
// Machines, sessions, derived update status and planned actions

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>

namespace vdalign {

// Type aliases for clarity
using SiteId = std::string;
using Endpoint = std::string;
using HostName = std::string;
using TaskId = std::string;
using Timestamp = uint64_t;
using SystemTime = std::chrono::system_clock::time_point;

// Disk image identifier as resolved from the host; nullopt when unresolved
using DiskImageId = std::optional<std::string>;

// Update status derived from a disk image identifier
enum class UpdateStatus : uint8_t {
    INELIGIBLE = 0,        // Image does not belong to the managed family
    UNKNOWN = 1,           // Image identifier could not be resolved
    RESTART_REQUIRED = 2,  // Managed family, not on the target version
    UPDATE_COMPLETED = 3   // Managed family, on the target version
};

// Remedial action proposed for a machine or session
enum class ProposedAction : uint8_t {
    NONE = 0,
    NAG = 1,      // Ask the user to log off
    RESTART = 2   // Issue a restart power action
};

// Which entities a run looks at
enum class SearchScope : uint8_t {
    AVAILABLE_MACHINES = 0,
    MACHINES_WITH_SESSIONS = 1,
    BOTH = 2
};

enum class EntityKind : uint8_t {
    MACHINE = 0,
    SESSION = 1
};

// Status reported by a management subsystem on an endpoint
enum class SubsystemStatus : uint8_t {
    OK = 0,
    DEGRADED = 1,
    FAILED = 2,
    OFFLINE = 3,
    UNKNOWN = 4
};

// Brokering state of a machine
enum class SummaryState : uint8_t {
    UNKNOWN = 0,
    OFF = 1,
    UNREGISTERED = 2,
    AVAILABLE = 3,
    IN_USE = 4,
    DISCONNECTED = 5,
    PREPARING = 6
};

enum class PowerState : uint8_t {
    UNKNOWN = 0,
    OFF = 1,
    ON = 2,
    TURNING_ON = 3,
    TURNING_OFF = 4,
    SUSPENDED = 5
};

// Activity state of a user session
enum class SessionState : uint8_t {
    ACTIVE = 0,
    INACTIVE = 1
};

// Progress of an asynchronous power action
enum class TaskState : uint8_t {
    PENDING = 0,
    STARTED = 1,
    COMPLETED = 2,
    FAILED = 3,
    CANCELED = 4,
    LOST = 5
};

// Result of probing one endpoint
struct HealthProbe {
    SubsystemStatus broker = SubsystemStatus::OFFLINE;
    SubsystemStatus hypervisor = SubsystemStatus::OFFLINE;

    bool healthy() const noexcept {
        return broker == SubsystemStatus::OK && hypervisor == SubsystemStatus::OK;
    }
};

// Unoccupied managed desktop
struct Machine {
    std::string machine_name;      // Broker identity, e.g. "CORP\\VDI-001"
    HostName dns_name;             // Host queried for its disk image
    std::string desktop_group;
    SiteId site;
    Endpoint endpoint;             // Endpoint the machine was listed from
    SummaryState summary_state = SummaryState::UNKNOWN;
    PowerState power_state = PowerState::UNKNOWN;
    bool in_maintenance_mode = false;
    DiskImageId disk_image;

    // Eligible for an immediate restart
    bool is_restartable() const noexcept {
        return summary_state == SummaryState::AVAILABLE &&
               power_state == PowerState::ON &&
               !in_maintenance_mode;
    }
};

// Occupied desktop
struct Session {
    std::string session_key;       // Broker identity of the session
    std::string machine_name;      // Machine hosting the session
    HostName dns_name;
    std::string user_name;
    std::string desktop_group;
    SiteId site;
    Endpoint endpoint;
    SessionState state = SessionState::ACTIVE;
    SystemTime state_change_time{};
    DiskImageId disk_image;

    bool is_active() const noexcept { return state == SessionState::ACTIVE; }

    std::chrono::milliseconds idle_duration(SystemTime now) const {
        if (now <= state_change_time) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - state_change_time);
    }
};

// One analysed entity with its derived status and proposed action.
// Immutable after analysis; live state is re-fetched at execution time.
struct ActionRecord {
    std::variant<Machine, Session> entity;
    UpdateStatus status = UpdateStatus::UNKNOWN;
    ProposedAction action = ProposedAction::NONE;

    EntityKind kind() const noexcept {
        return entity.index() == 0 ? EntityKind::MACHINE : EntityKind::SESSION;
    }

    const Machine* machine() const noexcept { return std::get_if<Machine>(&entity); }
    const Session* session() const noexcept { return std::get_if<Session>(&entity); }

    const SiteId& site() const;
    const Endpoint& endpoint() const;
    const DiskImageId& disk_image() const;
    const std::string& machine_name() const;

    // Human readable identity used in log lines
    std::string display_name() const;
};

// Restart submitted to an endpoint and awaiting completion
struct PendingTask {
    TaskId task_id;
    Endpoint endpoint;
    SiteId site;
    std::string machine_name;
    Timestamp submitted_at = 0;
};

// Status reported for a task when polled
struct TaskStatus {
    TaskState state = TaskState::PENDING;
    std::optional<SystemTime> completion_time;
    std::string detail;

    bool is_terminal() const noexcept {
        return state == TaskState::COMPLETED || state == TaskState::FAILED ||
               state == TaskState::CANCELED || state == TaskState::LOST;
    }

    bool succeeded() const noexcept { return state == TaskState::COMPLETED; }
};

// Utility functions for common operations
namespace Utils {

// Get current timestamp in milliseconds
inline Timestamp now_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string update_status_to_string(UpdateStatus status);
std::string proposed_action_to_string(ProposedAction action);
std::string search_scope_to_string(SearchScope scope);
std::string entity_kind_to_string(EntityKind kind);
std::string subsystem_status_to_string(SubsystemStatus status);
std::string summary_state_to_string(SummaryState state);
std::string power_state_to_string(PowerState state);
std::string session_state_to_string(SessionState state);
std::string task_state_to_string(TaskState state);

// Parsers are case-insensitive and return nullopt on unrecognised input
std::optional<SearchScope> string_to_search_scope(const std::string& value);
std::optional<SubsystemStatus> string_to_subsystem_status(const std::string& value);
std::optional<SummaryState> string_to_summary_state(const std::string& value);
std::optional<PowerState> string_to_power_state(const std::string& value);
std::optional<SessionState> string_to_session_state(const std::string& value);
std::optional<TaskState> string_to_task_state(const std::string& value);

bool scope_includes_machines(SearchScope scope);
bool scope_includes_sessions(SearchScope scope);

} // namespace Utils

} // namespace vdalign
