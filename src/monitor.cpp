// src/monitor.cpp
// Implementation of power action monitoring

#include "vdalign/monitor.hpp"
#include "vdalign/errors.hpp"
#include "vdalign/utils.hpp"
#include <algorithm>

namespace vdalign {

// CancellationToken implementation
void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

// PowerActionMonitor implementation
PowerActionMonitor::PowerActionMonitor(BrokerClient& broker, RunContext& context, Logger& logger,
                                       std::chrono::milliseconds poll_interval)
    : broker_(broker)
    , context_(context)
    , logger_(logger)
    , poll_interval_(poll_interval) {}

MonitorResult PowerActionMonitor::monitor(std::vector<PendingTask> pending,
                                          std::chrono::milliseconds timeout,
                                          const CancellationToken* token) {
    using Clock = std::chrono::steady_clock;

    MonitorResult result;
    if (pending.empty()) {
        return result;
    }

    CancellationToken local_token;
    const CancellationToken& cancel = token ? *token : local_token;

    Utils::ScopedTimer timer;
    const auto deadline = timer.started() + timeout;
    const size_t total = pending.size();

    logger_.info("Monitoring " + std::to_string(total) + " power action(s), timeout " +
                 Utils::format_duration(timeout));

    while (true) {
        ++result.rounds;

        std::vector<PendingTask> remaining;
        for (const auto& task : pending) {
            TaskStatus status;
            try {
                status = broker_.poll_task(task.endpoint, task.task_id);
            } catch (const std::exception& e) {
                logger_.warn(Errors::task_poll_failed(task.task_id, e.what()).what());
                remaining.push_back(task);
                continue;
            }

            if (status.is_terminal()) {
                record_outcome(task, status, result);
            } else {
                remaining.push_back(task);
            }
        }
        pending.swap(remaining);

        if (pending.empty()) {
            break;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            warn_unresolved(pending, "power action timeout of " + Utils::format_duration(timeout) + " reached");
            break;
        }

        auto wait = std::min(poll_interval_,
                             std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (cancel.wait_for(wait)) {
            result.cancelled = true;
            warn_unresolved(pending, "monitoring cancelled");
            break;
        }

        auto elapsed = timer.elapsed();
        logger_.info("Waiting on " + std::to_string(pending.size()) + "/" + std::to_string(total) +
                     " power action(s), elapsed " + Utils::format_duration(elapsed) + " of " +
                     Utils::format_duration(timeout));
    }

    result.still_pending = std::move(pending);
    result.elapsed = timer.elapsed();
    logger_.info("Monitoring finished: " + std::to_string(result.succeeded.size()) + " succeeded, " +
                 std::to_string(result.failed.size()) + " failed, " +
                 std::to_string(result.still_pending.size()) + " still pending");
    return result;
}

void PowerActionMonitor::record_outcome(const PendingTask& task, const TaskStatus& status,
                                        MonitorResult& result) {
    std::string completed_at = status.completion_time
        ? Utils::time_point_to_iso8601(*status.completion_time)
        : std::string("unknown time");
    std::string line = "Task " + task.task_id + " restarting " + task.machine_name + " on site " +
                       task.site + ": " + Utils::task_state_to_string(status.state) + " at " + completed_at;
    if (!status.detail.empty()) {
        line += " (" + status.detail + ")";
    }

    if (status.succeeded()) {
        ++context_.counters().restarts_succeeded;
        logger_.info(line);
        result.succeeded.push_back(TaskOutcome{task, status});
    } else {
        ++context_.counters().restarts_completed_failed;
        logger_.error(line);
        result.failed.push_back(TaskOutcome{task, status});
    }
}

void PowerActionMonitor::warn_unresolved(const std::vector<PendingTask>& pending, const std::string& reason) {
    std::vector<std::string> names;
    names.reserve(pending.size());
    for (const auto& task : pending) {
        names.push_back(task.task_id + " (" + task.machine_name + ", site " + task.site + ")");
    }
    logger_.warn("Stopped monitoring, " + reason + "; " + std::to_string(pending.size()) +
                 " task(s) still pending: " + Utils::join(names, ", "));
}

} // namespace vdalign
