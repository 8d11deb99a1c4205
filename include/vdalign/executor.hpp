// include/vdalign/executor.hpp
// Purpose: Re-validates planned actions against live state and carries them out

#pragma once

#include "types.hpp"
#include "broker.hpp"
#include "run_context.hpp"
#include "logging.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace vdalign {

struct ExecutorOptions {
    bool simulate = false;
    std::string notification_title;
    std::string notification_text;
    std::optional<uint64_t> shuffle_seed;   // Unset: random order
    std::chrono::minutes idle_threshold{0}; // Minimum idle time before a session's machine is restarted
};

// What one execute() call did
struct ExecutionSummary {
    size_t restarts_submitted = 0;
    size_t restarts_simulated = 0;
    size_t restarts_failed = 0;
    size_t restarts_skipped = 0;
    size_t restarts_throttled = 0;
    size_t nags_sent = 0;
    size_t nags_simulated = 0;
    size_t nags_failed = 0;
    size_t nags_skipped = 0;
    size_t downgraded = 0;                  // Session restarts turned into nags
};

class ActionExecutor {
public:
    ActionExecutor(BrokerClient& broker, RunContext& context, ExecutorOptions options, Logger& logger);

    // Records are shuffled across sites before execution. Submitted restarts
    // are added to the context's pending tasks. Failures are logged and counted.
    ExecutionSummary execute(std::vector<ActionRecord> records);

    // Execution order for a record set
    std::vector<ActionRecord> shuffled(std::vector<ActionRecord> records) const;

    const ExecutorOptions& options() const noexcept { return options_; }

private:
    BrokerClient& broker_;
    RunContext& context_;
    ExecutorOptions options_;
    Logger& logger_;

    void restart_machine(const ActionRecord& record, ExecutionSummary& summary);
    void restart_session(const ActionRecord& record, ExecutionSummary& summary);
    void notify_session(const Session& session, ExecutionSummary& summary);
    void submit_restart(const Endpoint& endpoint, const SiteId& site, const std::string& machine_name,
                        const std::string& display_name, ExecutionSummary& summary);
};

} // namespace vdalign
