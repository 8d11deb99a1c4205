// src/run_context.cpp
// Implementation of run-scoped counters and budget

#include "vdalign/run_context.hpp"

namespace vdalign {

void RunCounters::reset() {
    nags_sent = 0;
    nags_failed = 0;
    nags_simulated = 0;
    restarts_requested = 0;
    restarts_failed = 0;
    restarts_simulated = 0;
    restarts_skipped = 0;
    restarts_throttled = 0;
    restarts_succeeded = 0;
    restarts_completed_failed = 0;
}

RunCounters::Snapshot RunCounters::snapshot() const {
    Snapshot s;
    s.nags_sent = nags_sent.load();
    s.nags_failed = nags_failed.load();
    s.nags_simulated = nags_simulated.load();
    s.restarts_requested = restarts_requested.load();
    s.restarts_failed = restarts_failed.load();
    s.restarts_simulated = restarts_simulated.load();
    s.restarts_skipped = restarts_skipped.load();
    s.restarts_throttled = restarts_throttled.load();
    s.restarts_succeeded = restarts_succeeded.load();
    s.restarts_completed_failed = restarts_completed_failed.load();
    return s;
}

RunContext::RunContext(size_t max_restart_actions)
    : max_restart_actions_(max_restart_actions)
    , started_(Clock::now()) {}

bool RunContext::try_reserve_restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (budget_used_ >= max_restart_actions_) {
        return false;
    }
    ++budget_used_;
    return true;
}

size_t RunContext::budget_used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_used_;
}

size_t RunContext::budget_remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_restart_actions_ - budget_used_;
}

void RunContext::add_pending(PendingTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(task));
}

std::vector<PendingTask> RunContext::take_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingTask> taken;
    taken.swap(pending_);
    return taken;
}

size_t RunContext::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::chrono::milliseconds RunContext::elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
}

void RunContext::reset() {
    counters_.reset();
    std::lock_guard<std::mutex> lock(mutex_);
    budget_used_ = 0;
    pending_.clear();
    started_ = Clock::now();
}

} // namespace vdalign
