// tests/test_orchestrator.cpp
// End-to-end runs against in-memory fleets

#include <gtest/gtest.h>
#include "vdalign/vdalign.hpp"
#include "vdalign/fake_broker.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>

using namespace vdalign;

namespace {

const char* ALL_VERSIONS = R"(^XDP\d{2}SLHS-\d{6}\.vhd$)";
const char* TARGET_VERSION = R"(SLHS-230401\.vhd$)";
const char* OUTDATED = "XDP07SLHS-230115.vhd";
const char* CURRENT = "XDP07SLHS-230401.vhd";

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = std::make_shared<Logger>();
        logger->set_console(false);
        logger->set_level(SystemLogLevel::DEBUG);
        logger->set_capture([this](SystemLogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(log_mutex);
            if (level == SystemLogLevel::WARN || level == SystemLogLevel::ERROR) {
                problems.push_back(message);
            }
        });

        broker = std::make_shared<FakeBroker>();
        resolver = std::make_shared<FakeDiskImageResolver>();
        add_endpoint("ddc-a.corp.local", "SiteA");
        add_endpoint("ddc-b.corp.local", "SiteB");
    }

    void add_endpoint(const std::string& address, const std::string& site) {
        FakeEndpoint endpoint;
        endpoint.address = address;
        endpoint.site = site;
        broker->add_endpoint(endpoint);
    }

    void add_machine(const std::string& name, const std::string& site, const std::string& image,
                     SummaryState state = SummaryState::AVAILABLE) {
        Machine m;
        m.machine_name = name;
        m.dns_name = name + ".corp.local";
        m.desktop_group = "Pool";
        m.site = site;
        m.summary_state = state;
        m.power_state = PowerState::ON;
        broker->add_machine(m);
        resolver->set_image(m.dns_name, image);
    }

    void add_session(const std::string& key, const std::string& machine_name, const std::string& site,
                     SessionState state, std::chrono::minutes idle, const std::string& image) {
        add_machine(machine_name, site, image, SummaryState::IN_USE);

        Session s;
        s.session_key = key;
        s.machine_name = machine_name;
        s.dns_name = machine_name + ".corp.local";
        s.user_name = "user" + key;
        s.desktop_group = "Pool";
        s.site = site;
        s.state = state;
        s.state_change_time = std::chrono::system_clock::now() - idle;
        broker->add_session(s);
    }

    ConfigBuilder builder() const {
        return ConfigBuilder({"ddc-a.corp.local", "ddc-b.corp.local"})
            .patterns(ALL_VERSIONS, TARGET_VERSION)
            .notification("Update pending", "Please log off")
            .restarts(10, std::chrono::minutes(240))
            .shuffle_seed(7)
            .query(4, std::chrono::milliseconds(2000))
            .monitoring(std::chrono::seconds(1), std::chrono::milliseconds(20));
    }

    RunReport run(const Config& config) {
        Orchestrator orchestrator(config, broker, resolver, logger);
        return orchestrator.run();
    }

    bool logged(const std::string& fragment) {
        std::lock_guard<std::mutex> lock(log_mutex);
        return std::any_of(problems.begin(), problems.end(), [&](const std::string& line) {
            return line.find(fragment) != std::string::npos;
        });
    }

    std::shared_ptr<Logger> logger;
    std::shared_ptr<FakeBroker> broker;
    std::shared_ptr<FakeDiskImageResolver> resolver;
    std::mutex log_mutex;
    std::vector<std::string> problems;
};

TEST_F(OrchestratorTest, TestMachineRestartAndSessionNagAcrossSites) {
    add_machine("VDI-A1", "SiteA", OUTDATED);
    add_session("1", "VDI-B1", "SiteB", SessionState::ACTIVE, std::chrono::minutes(5), OUTDATED);
    add_session("2", "VDI-B2", "SiteB", SessionState::INACTIVE, std::chrono::minutes(600), CURRENT);

    auto report = run(builder().build());

    ASSERT_EQ(broker->restarted_machines().size(), 1u);
    EXPECT_EQ(broker->restarted_machines()[0], "VDI-A1");
    ASSERT_EQ(broker->notifications().size(), 1u);
    EXPECT_EQ(broker->notifications()[0].session_key, "1");
    EXPECT_EQ(broker->notifications()[0].endpoint, "ddc-b.corp.local");

    EXPECT_EQ(report.counters.restarts_requested, 1u);
    EXPECT_EQ(report.counters.restarts_succeeded, 1u);
    EXPECT_EQ(report.counters.nags_sent, 1u);
    EXPECT_EQ(report.restarts_pending, 0u);

    EXPECT_EQ(report.by_status.at("RestartRequired"), 2u);
    EXPECT_EQ(report.by_status.at("UpdateCompleted"), 1u);
    EXPECT_EQ(report.by_action.at("Restart"), 1u);
    EXPECT_EQ(report.by_action.at("Nag"), 1u);
    EXPECT_EQ(report.by_action.at("None"), 1u);

    ASSERT_EQ(report.sites.size(), 2u);
    EXPECT_EQ(report.sites[0].site, "SiteA");
    EXPECT_EQ(report.sites[0].machines_analyzed, 1u);
    EXPECT_EQ(report.sites[1].site, "SiteB");
    EXPECT_EQ(report.sites[1].sessions_analyzed, 2u);
}

TEST_F(OrchestratorTest, TestActiveSessionIsNeverRestarted) {
    add_session("1", "VDI-B1", "SiteB", SessionState::ACTIVE, std::chrono::minutes(900), OUTDATED);

    auto report = run(builder().build());

    EXPECT_TRUE(broker->restarted_machines().empty());
    ASSERT_EQ(broker->notifications().size(), 1u);
    EXPECT_EQ(broker->notifications()[0].title, "Update pending");
    EXPECT_EQ(broker->notifications()[0].text, "Please log off");
    EXPECT_EQ(report.counters.restarts_requested, 0u);
}

TEST_F(OrchestratorTest, TestIdleSessionRestartsItsMachine) {
    add_session("1", "VDI-B1", "SiteB", SessionState::INACTIVE, std::chrono::minutes(300), OUTDATED);

    auto report = run(builder().build());

    ASSERT_EQ(broker->restarted_machines().size(), 1u);
    EXPECT_EQ(broker->restarted_machines()[0], "VDI-B1");
    EXPECT_TRUE(broker->notifications().empty());
    EXPECT_EQ(report.counters.restarts_succeeded, 1u);
}

TEST_F(OrchestratorTest, TestSessionPassDeferredWhileMachinesNeedRestart) {
    add_machine("VDI-A1", "SiteA", OUTDATED);
    add_session("1", "VDI-A2", "SiteA", SessionState::INACTIVE, std::chrono::minutes(600), OUTDATED);
    add_session("2", "VDI-B1", "SiteB", SessionState::ACTIVE, std::chrono::minutes(1), OUTDATED);

    auto report = run(builder().build());

    ASSERT_EQ(report.sites.size(), 2u);
    EXPECT_TRUE(report.sites[0].session_pass_deferred);
    EXPECT_EQ(report.sites[0].sessions_analyzed, 0u);
    EXPECT_FALSE(report.sites[1].session_pass_deferred);

    ASSERT_EQ(broker->restarted_machines().size(), 1u);
    EXPECT_EQ(broker->restarted_machines()[0], "VDI-A1");
    ASSERT_EQ(broker->notifications().size(), 1u);
    EXPECT_EQ(broker->notifications()[0].session_key, "2");
}

TEST_F(OrchestratorTest, TestBudgetIsSharedAcrossSites) {
    for (int i = 0; i < 3; ++i) {
        add_machine("VDI-A" + std::to_string(i), "SiteA", OUTDATED);
        add_machine("VDI-B" + std::to_string(i), "SiteB", OUTDATED);
    }

    auto report = run(builder().restarts(4, std::chrono::minutes(240)).build());

    EXPECT_EQ(broker->restarted_machines().size(), 4u);
    EXPECT_EQ(report.counters.restarts_requested, 4u);
    EXPECT_EQ(report.counters.restarts_throttled, 2u);
    EXPECT_TRUE(logged("restart budget of 4 reached"));
}

TEST_F(OrchestratorTest, TestUnresolvedImagesAreNotActedOn) {
    add_machine("VDI-A1", "SiteA", OUTDATED);
    add_machine("VDI-A2", "SiteA", OUTDATED);
    resolver->set_image("VDI-A2.corp.local", std::nullopt);
    resolver->set_failure("VDI-A1.corp.local", "WinRM refused");

    auto report = run(builder().build());

    EXPECT_TRUE(broker->restarted_machines().empty());
    EXPECT_EQ(report.by_status.at("Unknown"), 2u);
    EXPECT_EQ(report.by_disk_image.at(UNRESOLVED_IMAGE_LABEL), 2u);
}

TEST_F(OrchestratorTest, TestNoHealthyEndpointIsFatal) {
    broker->set_endpoint_health("ddc-a.corp.local", SubsystemStatus::DEGRADED, SubsystemStatus::OK);
    broker->set_endpoint_health("ddc-b.corp.local", SubsystemStatus::OK, SubsystemStatus::OFFLINE);
    add_machine("VDI-A1", "SiteA", OUTDATED);

    Orchestrator orchestrator(builder().build(), broker, resolver, logger);
    EXPECT_THROW(orchestrator.run(), FatalError);
    EXPECT_TRUE(broker->restarted_machines().empty());
}

TEST_F(OrchestratorTest, TestUnhealthySiteIsSkipped) {
    broker->set_endpoint_health("ddc-a.corp.local", SubsystemStatus::FAILED, SubsystemStatus::OK);
    add_machine("VDI-A1", "SiteA", OUTDATED);
    add_machine("VDI-B1", "SiteB", OUTDATED);

    auto report = run(builder().build());

    ASSERT_EQ(report.sites.size(), 1u);
    EXPECT_EQ(report.sites[0].site, "SiteB");
    ASSERT_EQ(broker->restarted_machines().size(), 1u);
    EXPECT_EQ(broker->restarted_machines()[0], "VDI-B1");
}

TEST_F(OrchestratorTest, TestMissingCollaboratorsAreFatal) {
    Config config = builder().build();
    EXPECT_THROW({ Orchestrator o(config, nullptr, resolver, logger); }, FatalError);
    EXPECT_THROW({ Orchestrator o(config, broker, nullptr, logger); }, FatalError);
}

TEST_F(OrchestratorTest, TestInvalidConfigIsRejected) {
    Config config(std::vector<std::string>{"ddc-a.corp.local"});
    EXPECT_THROW({ Orchestrator o(config, broker, resolver, logger); }, ConfigError);
}

TEST_F(OrchestratorTest, TestAsyncRunSkipsMonitoring) {
    add_machine("VDI-A1", "SiteA", OUTDATED);

    auto report = run(builder()
        .monitoring(std::chrono::seconds(1), std::chrono::milliseconds(20), true)
        .build());

    EXPECT_TRUE(report.monitoring_skipped);
    EXPECT_EQ(report.restarts_pending, 1u);
    ASSERT_EQ(report.unresolved_tasks.size(), 1u);
    EXPECT_EQ(report.unresolved_tasks[0].machine_name, "VDI-A1");
    EXPECT_EQ(broker->poll_count(), 0u);
}

TEST_F(OrchestratorTest, TestMonitorTimeoutReportsPendingTasks) {
    broker->set_task_progression({TaskState::STARTED});
    add_machine("VDI-A1", "SiteA", OUTDATED);

    auto report = run(builder().build());

    EXPECT_FALSE(report.monitoring_skipped);
    EXPECT_EQ(report.restarts_pending, 1u);
    EXPECT_EQ(report.counters.restarts_succeeded, 0u);
    ASSERT_EQ(report.unresolved_tasks.size(), 1u);
    EXPECT_TRUE(logged(report.unresolved_tasks[0].task_id));
    EXPECT_GE(report.elapsed, std::chrono::milliseconds(1000));
}

TEST_F(OrchestratorTest, TestSimulationMakesNoChanges) {
    add_machine("VDI-A1", "SiteA", OUTDATED);
    add_session("1", "VDI-B1", "SiteB", SessionState::ACTIVE, std::chrono::minutes(5), OUTDATED);

    auto report = run(builder().simulate(true).build());

    EXPECT_TRUE(broker->restarted_machines().empty());
    EXPECT_TRUE(broker->notifications().empty());
    EXPECT_TRUE(report.simulated);
    EXPECT_EQ(report.counters.restarts_simulated, 1u);
    EXPECT_EQ(report.counters.nags_simulated, 1u);
    EXPECT_EQ(report.restarts_pending, 0u);
    EXPECT_EQ(broker->poll_count(), 0u);
}

TEST_F(OrchestratorTest, TestRepeatedRunsAreIndependent) {
    add_machine("VDI-A1", "SiteA", OUTDATED);
    add_machine("VDI-A2", "SiteA", CURRENT);

    Orchestrator orchestrator(builder().build(), broker, resolver, logger);
    auto first = orchestrator.run();
    auto second = orchestrator.run();

    EXPECT_EQ(first.by_status, second.by_status);
    EXPECT_EQ(first.by_action, second.by_action);
    EXPECT_EQ(first.by_disk_image, second.by_disk_image);
    EXPECT_EQ(first.counters.restarts_requested, 1u);
    EXPECT_EQ(second.counters.restarts_requested, 1u);
    EXPECT_EQ(broker->restarted_machines().size(), 2u);
}

TEST_F(OrchestratorTest, TestCancelDoesNotCarryIntoNextRun) {
    add_machine("VDI-A1", "SiteA", OUTDATED);

    Orchestrator orchestrator(builder().build(), broker, resolver, logger);
    orchestrator.cancel();
    auto report = orchestrator.run();

    EXPECT_EQ(report.counters.restarts_requested, 1u);
    EXPECT_EQ(report.counters.restarts_succeeded, 1u);
    EXPECT_EQ(report.restarts_pending, 0u);
    EXPECT_TRUE(report.unresolved_tasks.empty());
    EXPECT_GE(broker->poll_count(), 2u);
}

TEST_F(OrchestratorTest, TestJsonReportIsWritten) {
    const std::string path = "/tmp/vdalign_orchestrator_report.json";
    std::remove(path.c_str());
    add_machine("VDI-A1", "SiteA", OUTDATED);

    run(builder().json_report(path).build());

    ASSERT_TRUE(Utils::file_exists(path));
    auto doc = nlohmann::json::parse(Utils::read_file_contents(path));
    EXPECT_EQ(doc["counters"]["restarts_requested"].get<uint64_t>(), 1u);
    EXPECT_EQ(doc["records"].size(), 1u);
    std::remove(path.c_str());
}

TEST_F(OrchestratorTest, TestReportWriteFailureIsLogged) {
    add_machine("VDI-A1", "SiteA", OUTDATED);

    auto report = run(builder().json_report("/nonexistent-dir/sub/report.json").build());

    EXPECT_EQ(report.counters.restarts_requested, 1u);
    EXPECT_TRUE(logged("/nonexistent-dir/sub/report.json"));
}

TEST_F(OrchestratorTest, TestFleetFixtureRun) {
    auto fleet = load_fleet_fixture(R"({
        "endpoints": [
            {"address": "ddc-a.corp.local", "site": "SiteA"},
            {"address": "ddc-b.corp.local", "site": "SiteB", "broker": "Degraded"}
        ],
        "machines": [
            {"name": "VDI-A1", "dns_name": "vdi-a1.corp.local", "group": "Pool", "site": "SiteA",
             "image": "XDP07SLHS-230115.vhd"},
            {"name": "VDI-A2", "dns_name": "vdi-a2.corp.local", "group": "Pool", "site": "SiteA",
             "image": "XDP07SLHS-230401.vhd"},
            {"name": "VDI-A3", "group": "Pool", "site": "SiteA", "state": "InUse",
             "image": "XDP07SLHS-230115.vhd"}
        ],
        "sessions": [
            {"key": "s1", "machine": "VDI-A3", "user": "sam", "group": "Pool", "site": "SiteA",
             "state": "Inactive", "idle_minutes": 600, "image": "XDP07SLHS-230115.vhd"}
        ],
        "task_progression": ["Started", "Completed"]
    })");

    Orchestrator orchestrator(builder().build(), fleet.broker, fleet.resolver, logger);
    auto report = orchestrator.run();

    ASSERT_EQ(report.sites.size(), 1u);
    EXPECT_EQ(report.sites[0].site, "SiteA");
    EXPECT_EQ(report.sites[0].machines_analyzed, 2u);
    EXPECT_TRUE(report.sites[0].session_pass_deferred);
    ASSERT_EQ(fleet.broker->restarted_machines().size(), 1u);
    EXPECT_EQ(fleet.broker->restarted_machines()[0], "VDI-A1");
    EXPECT_EQ(report.counters.restarts_succeeded, 1u);
}

TEST_F(OrchestratorTest, TestMalformedFixtureIsRejected) {
    EXPECT_THROW(load_fleet_fixture("{\"machines\": [{\"site\": \"SiteA\"}]}"), ConfigError);
    EXPECT_THROW(load_fleet_fixture("not json"), ConfigError);
    EXPECT_THROW(load_fleet_fixture_file("/nonexistent-dir/fleet.json"), ConfigError);
}
