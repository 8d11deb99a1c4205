// src/orchestrator.cpp
// Orchestrator implementation wiring the engine components together

#include "vdalign/orchestrator.hpp"
#include "vdalign/classifier.hpp"
#include "vdalign/endpoint_selector.hpp"
#include "vdalign/executor.hpp"
#include "vdalign/inventory.hpp"
#include "vdalign/monitor.hpp"
#include "vdalign/planner.hpp"
#include "vdalign/query_pool.hpp"
#include "vdalign/run_context.hpp"
#include "vdalign/utils.hpp"

namespace vdalign {

class OrchestratorImpl {
public:
    OrchestratorImpl(const Config& config,
                     std::shared_ptr<BrokerClient> broker,
                     std::shared_ptr<DiskImageResolver> resolver,
                     std::shared_ptr<Logger> logger)
        : config_(config)
        , broker_(std::move(broker))
        , resolver_(std::move(resolver))
        , logger_(logger ? std::move(logger) : std::make_shared<Logger>(config.logging()))
        , context_(config.actions().max_restart_actions) {
        config_.validate();
        if (!broker_) {
            throw Errors::collaborator_unavailable("BrokerClient");
        }
        if (!resolver_) {
            throw Errors::collaborator_unavailable("DiskImageResolver");
        }
    }

    RunReport run() {
        context_.reset();
        cancellation_.reset();
        Logger& log = *logger_;
        const auto& search = config_.search();

        log.info("Starting run against " + std::to_string(config_.endpoints().endpoints.size()) +
                 " candidate endpoint(s), scope " + Utils::search_scope_to_string(search.scope) +
                 (config_.actions().simulate ? ", simulate mode" : ""));

        EndpointHealthSelector selector(*broker_, log);
        SiteEndpoints sites = selector.select(config_.endpoints().endpoints);

        PatternClassifier classifier(config_.patterns().all_versions_pattern,
                                     config_.patterns().target_version_pattern);
        ActionPlanner planner(classifier, config_.actions().idle_threshold);
        DiskImageQueryPool pool(resolver_, config_.query().concurrency_limit, config_.query().timeout);
        InventoryCollector inventory(*broker_, pool, log);

        ReportAggregator aggregator;
        std::vector<ActionRecord> planned;

        for (const auto& entry : sites) {
            const SiteId& site = entry.first;
            const Endpoint& endpoint = entry.second;

            SiteSummary summary;
            summary.site = site;
            summary.endpoint = endpoint;

            std::vector<ActionRecord> machine_records;
            if (Utils::scope_includes_machines(search.scope)) {
                auto machines = inventory.collect_machines(site, endpoint, search.group_filter, search.max_records);
                machine_records = planner.analyze_machines(machines);
                summary.machines_analyzed = machine_records.size();
                aggregator.add_records(machine_records);
                planned.insert(planned.end(), machine_records.begin(), machine_records.end());
            }

            if (Utils::scope_includes_sessions(search.scope)) {
                if (ActionPlanner::has_outstanding_restarts(machine_records, site)) {
                    summary.session_pass_deferred = true;
                    log.info("Site " + site + ": session pass deferred, available machines still need a restart");
                } else {
                    auto sessions = inventory.collect_sessions(site, endpoint, search.group_filter, search.max_records);
                    auto session_records = planner.analyze_sessions(sessions, std::chrono::system_clock::now());
                    summary.sessions_analyzed = session_records.size();
                    aggregator.add_records(session_records);
                    planned.insert(planned.end(), session_records.begin(), session_records.end());
                }
            }

            aggregator.add_site(std::move(summary));
        }

        ExecutorOptions options;
        options.simulate = config_.actions().simulate;
        options.notification_title = config_.actions().notification_title;
        options.notification_text = config_.actions().notification_text;
        options.shuffle_seed = config_.actions().shuffle_seed;
        options.idle_threshold = config_.actions().idle_threshold;

        ActionExecutor executor(*broker_, context_, options, log);
        executor.execute(std::move(planned));

        std::vector<PendingTask> pending = context_.take_pending();
        std::vector<PendingTask> unresolved;
        bool monitoring_skipped = false;

        if (pending.empty()) {
            log.debug("No power actions to monitor");
        } else if (config_.monitor().run_async) {
            monitoring_skipped = true;
            unresolved = std::move(pending);
            log.info("Not monitoring " + std::to_string(unresolved.size()) + " power action(s), running asynchronously");
        } else {
            PowerActionMonitor monitor(*broker_, context_, log, config_.monitor().poll_interval);
            MonitorResult result = monitor.monitor(std::move(pending), config_.monitor().power_action_timeout,
                                                   &cancellation_);
            unresolved = std::move(result.still_pending);
        }

        RunReport report = aggregator.build(context_.counters().snapshot(), unresolved, context_.elapsed(),
                                            monitoring_skipped, config_.actions().simulate);

        const auto& c = report.counters;
        log.info("Run finished in " + Utils::format_duration(report.elapsed) + ": nags sent " +
                 std::to_string(c.nags_sent) + ", nags failed " + std::to_string(c.nags_failed) +
                 ", restarts requested " + std::to_string(c.restarts_requested) +
                 ", restarts failed " + std::to_string(c.restarts_failed) +
                 ", restarts simulated " + std::to_string(c.restarts_simulated) +
                 ", restarts pending " + std::to_string(report.restarts_pending));

        const std::string& json_path = config_.report().json_report_path;
        if (!json_path.empty()) {
            try {
                ReportAggregator::write_json(report, json_path);
                log.info("JSON report written to " + json_path);
            } catch (const Error& e) {
                log.error(e.what());
            }
        }

        return report;
    }

    void cancel() {
        cancellation_.cancel();
    }

    const Config& config() const { return config_; }
    Logger& logger() { return *logger_; }

private:
    Config config_;
    std::shared_ptr<BrokerClient> broker_;
    std::shared_ptr<DiskImageResolver> resolver_;
    std::shared_ptr<Logger> logger_;
    RunContext context_;
    CancellationToken cancellation_;
};

// Orchestrator implementation
Orchestrator::Orchestrator(const Config& config,
                           std::shared_ptr<BrokerClient> broker,
                           std::shared_ptr<DiskImageResolver> resolver,
                           std::shared_ptr<Logger> logger)
    : pimpl_(std::make_unique<OrchestratorImpl>(config, std::move(broker), std::move(resolver),
                                                std::move(logger))) {}

Orchestrator::~Orchestrator() = default;

Orchestrator::Orchestrator(Orchestrator&&) noexcept = default;
Orchestrator& Orchestrator::operator=(Orchestrator&&) noexcept = default;

RunReport Orchestrator::run() {
    return pimpl_->run();
}

void Orchestrator::cancel() {
    pimpl_->cancel();
}

const Config& Orchestrator::config() const {
    return pimpl_->config();
}

Logger& Orchestrator::logger() {
    return pimpl_->logger();
}

} // namespace vdalign
