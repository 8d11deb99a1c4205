// tests/test_inventory.cpp
// Tests for the disk image query pool and inventory collection

#include <gtest/gtest.h>
#include "vdalign/inventory.hpp"
#include "vdalign/query_pool.hpp"
#include "vdalign/fake_broker.hpp"
#include "vdalign/errors.hpp"

using namespace vdalign;

class InventoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggingConfig logging;
        logging.log_to_console = false;
        logger = std::make_unique<Logger>(logging);
        logger->set_capture([this](SystemLogLevel level, const std::string& message) {
            if (level == SystemLogLevel::WARN || level == SystemLogLevel::ERROR) {
                problems.push_back(message);
            }
        });

        resolver = std::make_shared<FakeDiskImageResolver>();
        broker = std::make_shared<FakeBroker>();

        FakeEndpoint site_a;
        site_a.address = "ddc-a1";
        site_a.site = "SiteA";
        broker->add_endpoint(site_a);
    }

    void add_machine(const std::string& name, const std::string& group, const std::string& image) {
        Machine machine;
        machine.machine_name = "CORP\\" + name;
        machine.dns_name = name + ".corp.example";
        machine.desktop_group = group;
        machine.site = "SiteA";
        machine.summary_state = SummaryState::AVAILABLE;
        machine.power_state = PowerState::ON;
        broker->add_machine(machine);
        resolver->set_image(machine.dns_name, image);
    }

    std::shared_ptr<FakeDiskImageResolver> resolver;
    std::shared_ptr<FakeBroker> broker;
    std::unique_ptr<Logger> logger;
    std::vector<std::string> problems;
};

// Query pool
TEST_F(InventoryTest, TestPoolResolvesEveryHost) {
    resolver->set_image("h1", std::string("XDP07SLHS-230401.vhd"));
    resolver->set_image("h2", std::string("XDP07SLHS-230115.vhd"));

    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(2000));
    QueryBatchResult result = pool.resolve({"h1", "h2", "h3"});

    EXPECT_EQ(result.identifiers.size(), 3u);
    EXPECT_EQ(result.answered, 3u);
    EXPECT_EQ(result.timed_out, 0u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(result.lookup("h1"), std::optional<std::string>("XDP07SLHS-230401.vhd"));
    // No image value on the host is the same as no answer
    EXPECT_FALSE(result.lookup("h3").has_value());
    EXPECT_FALSE(result.lookup("not-requested").has_value());
}

TEST_F(InventoryTest, TestPoolQueriesDistinctHostsOnce) {
    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(2000));
    QueryBatchResult result = pool.resolve({"h1", "h1", "h2", "", "h2"});

    EXPECT_EQ(result.identifiers.size(), 2u);
    EXPECT_EQ(resolver->query_count(), 2u);
}

TEST_F(InventoryTest, TestPoolRespectsConcurrencyLimit) {
    std::vector<HostName> hosts;
    for (int i = 0; i < 12; ++i) {
        HostName host = "host-" + std::to_string(i);
        resolver->set_delay(host, std::chrono::milliseconds(20));
        hosts.push_back(host);
    }

    DiskImageQueryPool pool(resolver, 3, std::chrono::milliseconds(5000));
    QueryBatchResult result = pool.resolve(hosts);

    EXPECT_EQ(result.answered, 12u);
    EXPECT_LE(resolver->max_concurrent_queries(), 3u);
    EXPECT_GE(resolver->max_concurrent_queries(), 1u);
}

TEST_F(InventoryTest, TestPoolTimeoutYieldsUnresolvedIdentifiers) {
    resolver->set_image("fast", std::string("XDP07SLHS-230401.vhd"));
    resolver->set_image("slow", std::string("XDP07SLHS-230401.vhd"));
    resolver->set_delay("slow", std::chrono::milliseconds(800));

    DiskImageQueryPool pool(resolver, 2, std::chrono::milliseconds(150));
    QueryBatchResult result = pool.resolve({"fast", "slow"});

    EXPECT_EQ(result.answered, 1u);
    EXPECT_EQ(result.timed_out, 1u);
    EXPECT_TRUE(result.lookup("fast").has_value());
    EXPECT_FALSE(result.lookup("slow").has_value());
    // The batch returns at its deadline rather than waiting for the slow host
    EXPECT_LT(result.elapsed.count(), 700);
}

TEST_F(InventoryTest, TestPoolResolverFailureIsContained) {
    resolver->set_image("good", std::string("XDP07SLHS-230401.vhd"));
    resolver->set_failure("bad", "access denied");

    DiskImageQueryPool pool(resolver, 2, std::chrono::milliseconds(2000));
    QueryBatchResult result = pool.resolve({"good", "bad"});

    EXPECT_EQ(result.answered, 1u);
    EXPECT_EQ(result.failed, 1u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_NE(result.failures[0].find("bad"), std::string::npos);
    EXPECT_FALSE(result.lookup("bad").has_value());
}

TEST_F(InventoryTest, TestPoolEmptyBatch) {
    DiskImageQueryPool pool(resolver, 2, std::chrono::milliseconds(200));
    QueryBatchResult result = pool.resolve({});
    EXPECT_TRUE(result.identifiers.empty());
    EXPECT_EQ(resolver->query_count(), 0u);
}

TEST_F(InventoryTest, TestPoolRequiresResolver) {
    EXPECT_THROW(DiskImageQueryPool(nullptr, 2, std::chrono::milliseconds(200)), FatalError);
}

// Inventory collection
TEST_F(InventoryTest, TestCollectMachinesAnnotatesImages) {
    add_machine("VDI-001", "Pool-A", "XDP07SLHS-230401.vhd");
    add_machine("VDI-002", "Pool-A", "XDP07SLHS-230115.vhd");

    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(2000));
    InventoryCollector collector(*broker, pool, *logger);
    auto machines = collector.collect_machines("SiteA", "ddc-a1", "*", 100);

    ASSERT_EQ(machines.size(), 2u);
    for (const auto& machine : machines) {
        EXPECT_EQ(machine.site, "SiteA");
        EXPECT_EQ(machine.endpoint, "ddc-a1");
        EXPECT_TRUE(machine.disk_image.has_value());
    }
    EXPECT_EQ(*machines[1].disk_image, "XDP07SLHS-230115.vhd");
    EXPECT_EQ(collector.last_stats().listed, 2u);
    EXPECT_EQ(collector.last_stats().resolved, 2u);
}

TEST_F(InventoryTest, TestCollectMachinesHonoursFilterAndLimit) {
    add_machine("VDI-001", "Pool-A", "img");
    add_machine("VDI-002", "Pool-A", "img");
    add_machine("VDI-003", "Pool-A", "img");
    add_machine("LAB-001", "Lab", "img");

    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(2000));
    InventoryCollector collector(*broker, pool, *logger);

    auto pooled = collector.collect_machines("SiteA", "ddc-a1", "pool-*", 100);
    EXPECT_EQ(pooled.size(), 3u);

    auto limited = collector.collect_machines("SiteA", "ddc-a1", "*", 2);
    EXPECT_EQ(limited.size(), 2u);
}

TEST_F(InventoryTest, TestCollectMachinesTimeoutMarksUnknown) {
    add_machine("VDI-001", "Pool-A", "XDP07SLHS-230401.vhd");
    add_machine("VDI-002", "Pool-A", "XDP07SLHS-230401.vhd");
    resolver->set_delay("VDI-002.corp.example", std::chrono::milliseconds(800));

    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(150));
    InventoryCollector collector(*broker, pool, *logger);
    auto machines = collector.collect_machines("SiteA", "ddc-a1", "*", 100);

    ASSERT_EQ(machines.size(), 2u);
    EXPECT_TRUE(machines[0].disk_image.has_value());
    EXPECT_FALSE(machines[1].disk_image.has_value());
    EXPECT_EQ(collector.last_stats().timed_out, 1u);
    EXPECT_FALSE(problems.empty());
}

TEST_F(InventoryTest, TestListingFailureYieldsEmptyList) {
    FakeEndpoint failing;
    failing.address = "ddc-b1";
    failing.site = "SiteB";
    failing.listing_fails = true;
    broker->add_endpoint(failing);

    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(200));
    InventoryCollector collector(*broker, pool, *logger);

    std::vector<Machine> machines;
    EXPECT_NO_THROW(machines = collector.collect_machines("SiteB", "ddc-b1", "*", 100));
    EXPECT_TRUE(machines.empty());
    EXPECT_TRUE(collector.collect_sessions("SiteB", "ddc-b1", "*", 100).empty());
    EXPECT_EQ(problems.size(), 2u);
    EXPECT_EQ(resolver->query_count(), 0u);
}

TEST_F(InventoryTest, TestCollectSessionsUsesMachineNameWithoutDnsName) {
    Session session;
    session.session_key = "s-1";
    session.machine_name = "VDI-010";
    session.user_name = "alice";
    session.desktop_group = "Pool-A";
    session.site = "SiteA";
    session.state = SessionState::INACTIVE;
    broker->add_session(session);
    resolver->set_image("VDI-010", std::string("XDP07SLHS-230115.vhd"));

    DiskImageQueryPool pool(resolver, 4, std::chrono::milliseconds(2000));
    InventoryCollector collector(*broker, pool, *logger);
    auto sessions = collector.collect_sessions("SiteA", "ddc-a1", "*", 100);

    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].endpoint, "ddc-a1");
    ASSERT_TRUE(sessions[0].disk_image.has_value());
    EXPECT_EQ(*sessions[0].disk_image, "XDP07SLHS-230115.vhd");
    EXPECT_EQ(InventoryCollector::query_host(sessions[0]), "VDI-010");
}
