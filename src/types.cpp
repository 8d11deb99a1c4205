// src/types.cpp
// Implementation of record accessors and enum conversions

#include "vdalign/types.hpp"
#include <algorithm>
#include <cctype>

namespace vdalign {

namespace {

std::string normalize(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c == '_' || c == '-' || c == ' ') continue;
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

} // namespace

const SiteId& ActionRecord::site() const {
    if (const auto* m = machine()) return m->site;
    return std::get<Session>(entity).site;
}

const Endpoint& ActionRecord::endpoint() const {
    if (const auto* m = machine()) return m->endpoint;
    return std::get<Session>(entity).endpoint;
}

const DiskImageId& ActionRecord::disk_image() const {
    if (const auto* m = machine()) return m->disk_image;
    return std::get<Session>(entity).disk_image;
}

const std::string& ActionRecord::machine_name() const {
    if (const auto* m = machine()) return m->machine_name;
    return std::get<Session>(entity).machine_name;
}

std::string ActionRecord::display_name() const {
    if (const auto* m = machine()) {
        return m->machine_name;
    }
    const auto& s = std::get<Session>(entity);
    if (s.user_name.empty()) {
        return s.machine_name;
    }
    return s.user_name + "@" + s.machine_name;
}

namespace Utils {

std::string update_status_to_string(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::INELIGIBLE: return "Ineligible";
        case UpdateStatus::UNKNOWN: return "Unknown";
        case UpdateStatus::RESTART_REQUIRED: return "RestartRequired";
        case UpdateStatus::UPDATE_COMPLETED: return "UpdateCompleted";
        default: return "Unknown";
    }
}

std::string proposed_action_to_string(ProposedAction action) {
    switch (action) {
        case ProposedAction::NONE: return "None";
        case ProposedAction::NAG: return "Nag";
        case ProposedAction::RESTART: return "Restart";
        default: return "None";
    }
}

std::string search_scope_to_string(SearchScope scope) {
    switch (scope) {
        case SearchScope::AVAILABLE_MACHINES: return "AvailableMachines";
        case SearchScope::MACHINES_WITH_SESSIONS: return "MachinesWithSessions";
        case SearchScope::BOTH: return "Both";
        default: return "Both";
    }
}

std::string entity_kind_to_string(EntityKind kind) {
    return kind == EntityKind::MACHINE ? "Machine" : "Session";
}

std::string subsystem_status_to_string(SubsystemStatus status) {
    switch (status) {
        case SubsystemStatus::OK: return "OK";
        case SubsystemStatus::DEGRADED: return "Degraded";
        case SubsystemStatus::FAILED: return "Failed";
        case SubsystemStatus::OFFLINE: return "Offline";
        case SubsystemStatus::UNKNOWN: return "Unknown";
        default: return "Unknown";
    }
}

std::string summary_state_to_string(SummaryState state) {
    switch (state) {
        case SummaryState::UNKNOWN: return "Unknown";
        case SummaryState::OFF: return "Off";
        case SummaryState::UNREGISTERED: return "Unregistered";
        case SummaryState::AVAILABLE: return "Available";
        case SummaryState::IN_USE: return "InUse";
        case SummaryState::DISCONNECTED: return "Disconnected";
        case SummaryState::PREPARING: return "Preparing";
        default: return "Unknown";
    }
}

std::string power_state_to_string(PowerState state) {
    switch (state) {
        case PowerState::UNKNOWN: return "Unknown";
        case PowerState::OFF: return "Off";
        case PowerState::ON: return "On";
        case PowerState::TURNING_ON: return "TurningOn";
        case PowerState::TURNING_OFF: return "TurningOff";
        case PowerState::SUSPENDED: return "Suspended";
        default: return "Unknown";
    }
}

std::string session_state_to_string(SessionState state) {
    return state == SessionState::ACTIVE ? "Active" : "Inactive";
}

std::string task_state_to_string(TaskState state) {
    switch (state) {
        case TaskState::PENDING: return "Pending";
        case TaskState::STARTED: return "Started";
        case TaskState::COMPLETED: return "Completed";
        case TaskState::FAILED: return "Failed";
        case TaskState::CANCELED: return "Canceled";
        case TaskState::LOST: return "Lost";
        default: return "Pending";
    }
}

std::optional<SearchScope> string_to_search_scope(const std::string& value) {
    std::string key = normalize(value);
    if (key == "availablemachines") return SearchScope::AVAILABLE_MACHINES;
    if (key == "machineswithsessions") return SearchScope::MACHINES_WITH_SESSIONS;
    if (key == "both") return SearchScope::BOTH;
    return std::nullopt;
}

std::optional<SubsystemStatus> string_to_subsystem_status(const std::string& value) {
    std::string key = normalize(value);
    if (key == "ok") return SubsystemStatus::OK;
    if (key == "degraded") return SubsystemStatus::DEGRADED;
    if (key == "failed") return SubsystemStatus::FAILED;
    if (key == "offline") return SubsystemStatus::OFFLINE;
    if (key == "unknown") return SubsystemStatus::UNKNOWN;
    return std::nullopt;
}

std::optional<SummaryState> string_to_summary_state(const std::string& value) {
    std::string key = normalize(value);
    if (key == "unknown") return SummaryState::UNKNOWN;
    if (key == "off") return SummaryState::OFF;
    if (key == "unregistered") return SummaryState::UNREGISTERED;
    if (key == "available") return SummaryState::AVAILABLE;
    if (key == "inuse") return SummaryState::IN_USE;
    if (key == "disconnected") return SummaryState::DISCONNECTED;
    if (key == "preparing") return SummaryState::PREPARING;
    return std::nullopt;
}

std::optional<PowerState> string_to_power_state(const std::string& value) {
    std::string key = normalize(value);
    if (key == "unknown") return PowerState::UNKNOWN;
    if (key == "off") return PowerState::OFF;
    if (key == "on") return PowerState::ON;
    if (key == "turningon") return PowerState::TURNING_ON;
    if (key == "turningoff") return PowerState::TURNING_OFF;
    if (key == "suspended") return PowerState::SUSPENDED;
    return std::nullopt;
}

std::optional<SessionState> string_to_session_state(const std::string& value) {
    std::string key = normalize(value);
    if (key == "active") return SessionState::ACTIVE;
    // Anything the broker reports as not actively in use counts as inactive
    if (key == "inactive" || key == "disconnected") return SessionState::INACTIVE;
    return std::nullopt;
}

std::optional<TaskState> string_to_task_state(const std::string& value) {
    std::string key = normalize(value);
    if (key == "pending") return TaskState::PENDING;
    if (key == "started") return TaskState::STARTED;
    if (key == "completed") return TaskState::COMPLETED;
    if (key == "failed") return TaskState::FAILED;
    if (key == "canceled" || key == "cancelled") return TaskState::CANCELED;
    if (key == "lost") return TaskState::LOST;
    return std::nullopt;
}

bool scope_includes_machines(SearchScope scope) {
    return scope == SearchScope::AVAILABLE_MACHINES || scope == SearchScope::BOTH;
}

bool scope_includes_sessions(SearchScope scope) {
    return scope == SearchScope::MACHINES_WITH_SESSIONS || scope == SearchScope::BOTH;
}

} // namespace Utils
} // namespace vdalign
