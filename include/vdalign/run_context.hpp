// include/vdalign/run_context.hpp
// Purpose: Run-scoped counters, restart budget and pending task hand-off

#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace vdalign {

// Counters for one run; reset at the start of every run
struct RunCounters {
    std::atomic<uint64_t> nags_sent{0};
    std::atomic<uint64_t> nags_failed{0};
    std::atomic<uint64_t> nags_simulated{0};
    std::atomic<uint64_t> restarts_requested{0};
    std::atomic<uint64_t> restarts_failed{0};
    std::atomic<uint64_t> restarts_simulated{0};
    std::atomic<uint64_t> restarts_skipped{0};      // Stale at execution time
    std::atomic<uint64_t> restarts_throttled{0};    // Budget exhausted
    std::atomic<uint64_t> restarts_succeeded{0};    // Task completed
    std::atomic<uint64_t> restarts_completed_failed{0};

    void reset();

    // Create a copyable snapshot of the counters
    struct Snapshot {
        uint64_t nags_sent = 0;
        uint64_t nags_failed = 0;
        uint64_t nags_simulated = 0;
        uint64_t restarts_requested = 0;
        uint64_t restarts_failed = 0;
        uint64_t restarts_simulated = 0;
        uint64_t restarts_skipped = 0;
        uint64_t restarts_throttled = 0;
        uint64_t restarts_succeeded = 0;
        uint64_t restarts_completed_failed = 0;

        uint64_t restarts_attempted() const {
            return restarts_requested + restarts_failed;
        }
    };

    Snapshot snapshot() const;
};

class RunContext {
public:
    using Clock = std::chrono::steady_clock;

    explicit RunContext(size_t max_restart_actions);

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    RunCounters& counters() noexcept { return counters_; }
    const RunCounters& counters() const noexcept { return counters_; }

    // Claims one slot of the restart budget shared by real and simulated
    // restarts; false once the budget is spent. Safe to call concurrently.
    bool try_reserve_restart();
    size_t budget_used() const;
    size_t budget_remaining() const;
    size_t max_restart_actions() const noexcept { return max_restart_actions_; }

    // Pending tasks are appended by the executor and taken once by the monitor
    void add_pending(PendingTask task);
    std::vector<PendingTask> take_pending();
    size_t pending_count() const;

    std::chrono::milliseconds elapsed() const;

    // Clears counters, budget and pending tasks and restarts the clock
    void reset();

private:
    const size_t max_restart_actions_;
    RunCounters counters_;

    mutable std::mutex mutex_;
    size_t budget_used_ = 0;
    std::vector<PendingTask> pending_;
    Clock::time_point started_;
};

} // namespace vdalign
