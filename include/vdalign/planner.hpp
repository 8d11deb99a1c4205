// include/vdalign/planner.hpp
// Purpose: Turns classified machines and sessions into proposed actions

#pragma once

#include "types.hpp"
#include "classifier.hpp"
#include <vector>
#include <chrono>

namespace vdalign {

class ActionPlanner {
public:
    ActionPlanner(const PatternClassifier& classifier, std::chrono::minutes idle_threshold);

    // Machines: RestartRequired -> Restart, otherwise None
    static ProposedAction plan_machine(UpdateStatus status) noexcept;

    // Sessions: RestartRequired and inactive for at least the idle threshold -> Restart,
    // RestartRequired otherwise -> Nag, anything else -> None
    ProposedAction plan_session(UpdateStatus status, SessionState state,
                                std::chrono::milliseconds idle) const noexcept;

    std::vector<ActionRecord> analyze_machines(const std::vector<Machine>& machines) const;
    std::vector<ActionRecord> analyze_sessions(const std::vector<Session>& sessions,
                                               SystemTime now) const;

    // True while a machine Restart planned for the site is outstanding.
    // Session analysis for such a site is deferred for the run.
    static bool has_outstanding_restarts(const std::vector<ActionRecord>& records, const SiteId& site);

    std::chrono::minutes idle_threshold() const noexcept { return idle_threshold_; }

private:
    const PatternClassifier& classifier_;
    std::chrono::minutes idle_threshold_;
};

} // namespace vdalign
