// include/vdalign/orchestrator.hpp
// Purpose: Main entry point running one alignment pass over the fleet
// Endpoint selection, per-site analysis, execution, monitoring and reporting

#pragma once

#include "config.hpp"
#include "broker.hpp"
#include "logging.hpp"
#include "report.hpp"
#include <memory>

namespace vdalign {

// Forward declaration
class OrchestratorImpl;

class Orchestrator {
public:
    // Validates the configuration (ConfigError) and requires both collaborators
    // (FatalError when either is missing). A logger is built from the
    // configuration when none is supplied.
    Orchestrator(const Config& config,
                 std::shared_ptr<BrokerClient> broker,
                 std::shared_ptr<DiskImageResolver> resolver,
                 std::shared_ptr<Logger> logger = nullptr);

    ~Orchestrator();

    // Non-copyable, movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) noexcept;
    Orchestrator& operator=(Orchestrator&&) noexcept;

    // Runs to completion and returns the report; partial failures are logged
    // and counted. Throws FatalError when no healthy endpoint is found.
    RunReport run();

    // Ends power action monitoring early; tasks still running are reported pending
    void cancel();

    const Config& config() const;
    Logger& logger();

private:
    std::unique_ptr<OrchestratorImpl> pimpl_;
};

} // namespace vdalign
