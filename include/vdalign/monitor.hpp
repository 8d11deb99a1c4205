// include/vdalign/monitor.hpp
// Purpose: Polls submitted power actions until they finish or the deadline passes

#pragma once

#include "types.hpp"
#include "broker.hpp"
#include "run_context.hpp"
#include "logging.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace vdalign {

// Cooperative cancellation for the monitor loop
class CancellationToken {
public:
    void cancel();
    // Clears a previous cancel so the token can guard another run
    void reset();
    bool is_cancelled() const;

    // Sleeps for up to timeout; returns true as soon as the token is cancelled
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

struct TaskOutcome {
    PendingTask task;
    TaskStatus status;
};

struct MonitorResult {
    std::vector<TaskOutcome> succeeded;
    std::vector<TaskOutcome> failed;
    std::vector<PendingTask> still_pending;   // Untracked after the loop ends
    bool timed_out = false;
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};
    size_t rounds = 0;
};

class PowerActionMonitor {
public:
    PowerActionMonitor(BrokerClient& broker, RunContext& context, Logger& logger,
                       std::chrono::milliseconds poll_interval);

    // Returns once every task is terminal, the timeout elapses or the token is
    // cancelled; never later than timeout plus one poll interval and one round
    // of polls. Poll failures keep a task pending.
    MonitorResult monitor(std::vector<PendingTask> pending, std::chrono::milliseconds timeout,
                          const CancellationToken* token = nullptr);

    std::chrono::milliseconds poll_interval() const noexcept { return poll_interval_; }

private:
    BrokerClient& broker_;
    RunContext& context_;
    Logger& logger_;
    std::chrono::milliseconds poll_interval_;

    void record_outcome(const PendingTask& task, const TaskStatus& status, MonitorResult& result);
    void warn_unresolved(const std::vector<PendingTask>& pending, const std::string& reason);
};

} // namespace vdalign
