// src/executor.cpp
// Implementation of throttled, re-validated action execution

#include "vdalign/executor.hpp"
#include "vdalign/errors.hpp"
#include <algorithm>
#include <random>

namespace vdalign {

ActionExecutor::ActionExecutor(BrokerClient& broker, RunContext& context, ExecutorOptions options,
                               Logger& logger)
    : broker_(broker)
    , context_(context)
    , options_(std::move(options))
    , logger_(logger) {}

std::vector<ActionRecord> ActionExecutor::shuffled(std::vector<ActionRecord> records) const {
    std::mt19937_64 rng;
    if (options_.shuffle_seed) {
        rng.seed(*options_.shuffle_seed);
    } else {
        std::random_device device;
        rng.seed((static_cast<uint64_t>(device()) << 32) ^ device());
    }
    std::shuffle(records.begin(), records.end(), rng);
    return records;
}

ExecutionSummary ActionExecutor::execute(std::vector<ActionRecord> records) {
    ExecutionSummary summary;

    std::vector<ActionRecord> actionable;
    for (auto& record : records) {
        if (record.action != ProposedAction::NONE) {
            actionable.push_back(std::move(record));
        }
    }
    if (actionable.empty()) {
        logger_.info("No actions to execute");
        return summary;
    }

    logger_.info("Executing " + std::to_string(actionable.size()) + " action(s)" +
                 (options_.simulate ? " in simulate mode" : ""));

    for (const auto& record : shuffled(std::move(actionable))) {
        if (record.action == ProposedAction::RESTART) {
            if (record.kind() == EntityKind::MACHINE) {
                restart_machine(record, summary);
            } else {
                restart_session(record, summary);
            }
        } else if (record.action == ProposedAction::NAG && record.session()) {
            std::optional<Session> live;
            try {
                live = broker_.refresh_session(record.endpoint(), record.session()->session_key);
            } catch (const std::exception& e) {
                ++summary.nags_failed;
                ++context_.counters().nags_failed;
                logger_.warn(Errors::notification_failed(record.display_name(), e.what()).what());
                continue;
            }
            if (!live) {
                ++summary.nags_skipped;
                logger_.info("Skipping notification for " + record.display_name() + ": session no longer exists");
                continue;
            }
            live->site = record.site();
            live->endpoint = record.endpoint();
            notify_session(*live, summary);
        }
    }

    if (summary.restarts_throttled > 0) {
        logger_.warn(std::to_string(summary.restarts_throttled) +
                     " restart(s) not attempted, restart budget of " +
                     std::to_string(context_.max_restart_actions()) + " reached");
    }
    return summary;
}

void ActionExecutor::restart_machine(const ActionRecord& record, ExecutionSummary& summary) {
    const Machine& planned = *record.machine();

    std::optional<Machine> live;
    try {
        live = broker_.refresh_machine(record.endpoint(), planned.machine_name);
    } catch (const std::exception& e) {
        ++summary.restarts_skipped;
        ++context_.counters().restarts_skipped;
        logger_.warn("Skipping restart of " + planned.machine_name + ": state refresh failed: " + e.what());
        return;
    }

    if (!live) {
        ++summary.restarts_skipped;
        ++context_.counters().restarts_skipped;
        logger_.info("Skipping restart of " + planned.machine_name + ": machine no longer listed");
        return;
    }
    if (!live->is_restartable()) {
        ++summary.restarts_skipped;
        ++context_.counters().restarts_skipped;
        logger_.info("Skipping restart of " + planned.machine_name + ": state is now " +
                     Utils::summary_state_to_string(live->summary_state) + "/" +
                     Utils::power_state_to_string(live->power_state) +
                     (live->in_maintenance_mode ? ", in maintenance mode" : ""));
        return;
    }

    submit_restart(record.endpoint(), record.site(), planned.machine_name, planned.machine_name, summary);
}

void ActionExecutor::restart_session(const ActionRecord& record, ExecutionSummary& summary) {
    const Session& planned = *record.session();

    std::optional<Session> live;
    try {
        live = broker_.refresh_session(record.endpoint(), planned.session_key);
    } catch (const std::exception& e) {
        ++summary.restarts_skipped;
        ++context_.counters().restarts_skipped;
        logger_.warn("Skipping restart of " + record.display_name() + ": state refresh failed: " + e.what());
        return;
    }

    if (!live) {
        ++summary.restarts_skipped;
        ++context_.counters().restarts_skipped;
        logger_.info("Skipping restart of " + record.display_name() + ": session no longer exists");
        return;
    }

    live->site = record.site();
    live->endpoint = record.endpoint();

    if (live->is_active()) {
        ++summary.downgraded;
        logger_.info("Session " + record.display_name() + " became active, sending a notification instead");
        notify_session(*live, summary);
        return;
    }
    if (live->idle_duration(std::chrono::system_clock::now()) < options_.idle_threshold) {
        ++summary.downgraded;
        logger_.info("Session " + record.display_name() + " has been idle less than " +
                     std::to_string(options_.idle_threshold.count()) + " minute(s), sending a notification instead");
        notify_session(*live, summary);
        return;
    }

    const std::string& machine_name = live->machine_name.empty() ? planned.machine_name : live->machine_name;
    submit_restart(record.endpoint(), record.site(), machine_name, record.display_name(), summary);
}

void ActionExecutor::notify_session(const Session& session, ExecutionSummary& summary) {
    std::string name = session.user_name.empty() ? session.session_key
                                                 : session.user_name + "@" + session.machine_name;

    if (options_.simulate) {
        ++summary.nags_simulated;
        ++context_.counters().nags_simulated;
        logger_.info("[SIMULATE] Would notify " + name + ": " + options_.notification_title);
        return;
    }

    bool delivered = false;
    try {
        delivered = broker_.submit_notification(session.endpoint, session.session_key,
                                                options_.notification_title, options_.notification_text);
    } catch (const std::exception& e) {
        ++summary.nags_failed;
        ++context_.counters().nags_failed;
        logger_.warn(Errors::notification_failed(name, e.what()).what());
        return;
    }

    if (delivered) {
        ++summary.nags_sent;
        ++context_.counters().nags_sent;
        logger_.info("Notified " + name);
    } else {
        ++summary.nags_failed;
        ++context_.counters().nags_failed;
        logger_.warn(Errors::notification_failed(name, "broker refused the message").what());
    }
}

void ActionExecutor::submit_restart(const Endpoint& endpoint, const SiteId& site,
                                    const std::string& machine_name, const std::string& display_name,
                                    ExecutionSummary& summary) {
    if (!context_.try_reserve_restart()) {
        ++summary.restarts_throttled;
        ++context_.counters().restarts_throttled;
        logger_.debug("Restart budget exhausted, not restarting " + display_name);
        return;
    }

    if (options_.simulate) {
        ++summary.restarts_simulated;
        ++context_.counters().restarts_simulated;
        logger_.info("[SIMULATE] Would restart " + machine_name + " on site " + site);
        return;
    }

    TaskId task_id;
    try {
        task_id = broker_.submit_restart(endpoint, machine_name);
    } catch (const std::exception& e) {
        ++summary.restarts_failed;
        ++context_.counters().restarts_failed;
        logger_.error(Errors::restart_rejected(machine_name, e.what()).what());
        return;
    }

    if (task_id.empty()) {
        ++summary.restarts_failed;
        ++context_.counters().restarts_failed;
        logger_.error(Errors::restart_rejected(machine_name, "no task identity returned").what());
        return;
    }

    PendingTask task;
    task.task_id = task_id;
    task.endpoint = endpoint;
    task.site = site;
    task.machine_name = machine_name;
    task.submitted_at = Utils::now_milliseconds();
    context_.add_pending(std::move(task));

    ++summary.restarts_submitted;
    ++context_.counters().restarts_requested;
    logger_.info("Restart of " + machine_name + " on site " + site + " submitted as task " + task_id);
}

} // namespace vdalign
