// src/planner.cpp
// Implementation of action planning

#include "vdalign/planner.hpp"

namespace vdalign {

ActionPlanner::ActionPlanner(const PatternClassifier& classifier, std::chrono::minutes idle_threshold)
    : classifier_(classifier), idle_threshold_(idle_threshold) {}

ProposedAction ActionPlanner::plan_machine(UpdateStatus status) noexcept {
    return status == UpdateStatus::RESTART_REQUIRED ? ProposedAction::RESTART : ProposedAction::NONE;
}

ProposedAction ActionPlanner::plan_session(UpdateStatus status, SessionState state,
                                           std::chrono::milliseconds idle) const noexcept {
    if (status != UpdateStatus::RESTART_REQUIRED) {
        return ProposedAction::NONE;
    }
    if (state == SessionState::INACTIVE && idle >= idle_threshold_) {
        return ProposedAction::RESTART;
    }
    return ProposedAction::NAG;
}

std::vector<ActionRecord> ActionPlanner::analyze_machines(const std::vector<Machine>& machines) const {
    std::vector<ActionRecord> records;
    records.reserve(machines.size());
    for (const auto& machine : machines) {
        ActionRecord record;
        record.status = classifier_.classify(machine.disk_image);
        record.action = plan_machine(record.status);
        record.entity = machine;
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<ActionRecord> ActionPlanner::analyze_sessions(const std::vector<Session>& sessions,
                                                          SystemTime now) const {
    std::vector<ActionRecord> records;
    records.reserve(sessions.size());
    for (const auto& session : sessions) {
        ActionRecord record;
        record.status = classifier_.classify(session.disk_image);
        record.action = plan_session(record.status, session.state, session.idle_duration(now));
        record.entity = session;
        records.push_back(std::move(record));
    }
    return records;
}

bool ActionPlanner::has_outstanding_restarts(const std::vector<ActionRecord>& records, const SiteId& site) {
    for (const auto& record : records) {
        if (record.kind() == EntityKind::MACHINE &&
            record.action == ProposedAction::RESTART &&
            record.site() == site) {
            return true;
        }
    }
    return false;
}

} // namespace vdalign
