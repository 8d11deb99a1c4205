// tests/test_endpoint_selector.cpp
// Tests for endpoint health filtering and per-site selection

#include <gtest/gtest.h>
#include "vdalign/endpoint_selector.hpp"
#include "vdalign/fake_broker.hpp"
#include "vdalign/errors.hpp"

using namespace vdalign;

class EndpointSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggingConfig logging;
        logging.log_to_console = false;
        logger = std::make_unique<Logger>(logging);
    }

    FakeEndpoint endpoint(const std::string& address, const std::string& site) {
        FakeEndpoint e;
        e.address = address;
        e.site = site;
        return e;
    }

    FakeBroker broker;
    std::unique_ptr<Logger> logger;
};

TEST_F(EndpointSelectorTest, TestOneEndpointPerSite) {
    broker.add_endpoint(endpoint("ddc-a1", "SiteA"));
    broker.add_endpoint(endpoint("ddc-b1", "SiteB"));

    EndpointHealthSelector selector(broker, *logger);
    SiteEndpoints sites = selector.select({"ddc-a1", "ddc-b1"});

    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites["SiteA"], "ddc-a1");
    EXPECT_EQ(sites["SiteB"], "ddc-b1");
}

TEST_F(EndpointSelectorTest, TestFirstHealthyCandidateWins) {
    broker.add_endpoint(endpoint("ddc-a1", "SiteA"));
    broker.add_endpoint(endpoint("ddc-a2", "SiteA"));

    EndpointHealthSelector selector(broker, *logger);
    SiteEndpoints sites = selector.select({"ddc-a2", "ddc-a1"});

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites["SiteA"], "ddc-a2");

    const auto& checks = selector.checks();
    ASSERT_EQ(checks.size(), 2u);
    EXPECT_TRUE(checks[0].selected);
    EXPECT_FALSE(checks[1].selected);
    EXPECT_NE(checks[1].note.find("duplicate"), std::string::npos);
}

TEST_F(EndpointSelectorTest, TestUnhealthySubsystemSkipsCandidate) {
    FakeEndpoint degraded = endpoint("ddc-a1", "SiteA");
    degraded.hypervisor_status = SubsystemStatus::DEGRADED;
    broker.add_endpoint(degraded);
    broker.add_endpoint(endpoint("ddc-a2", "SiteA"));

    EndpointHealthSelector selector(broker, *logger);
    SiteEndpoints sites = selector.select({"ddc-a1", "ddc-a2"});

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites["SiteA"], "ddc-a2");
}

TEST_F(EndpointSelectorTest, TestProbeFailureIsTreatedAsOffline) {
    FakeEndpoint failing = endpoint("ddc-a1", "SiteA");
    failing.probe_throws = true;
    broker.add_endpoint(failing);
    broker.add_endpoint(endpoint("ddc-b1", "SiteB"));

    EndpointHealthSelector selector(broker, *logger);
    SiteEndpoints sites;
    EXPECT_NO_THROW(sites = selector.select({"ddc-a1", "ddc-b1"}));

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites.count("SiteA"), 0u);
    EXPECT_EQ(selector.checks()[0].probe.broker, SubsystemStatus::OFFLINE);
    EXPECT_EQ(selector.checks()[0].probe.hypervisor, SubsystemStatus::OFFLINE);
}

TEST_F(EndpointSelectorTest, TestSiteLookupFailureSkipsCandidate) {
    FakeEndpoint failing = endpoint("ddc-a1", "SiteA");
    failing.site_lookup_fails = true;
    broker.add_endpoint(failing);
    broker.add_endpoint(endpoint("ddc-a2", "SiteA"));

    EndpointHealthSelector selector(broker, *logger);
    SiteEndpoints sites = selector.select({"ddc-a1", "ddc-a2"});

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites["SiteA"], "ddc-a2");
}

TEST_F(EndpointSelectorTest, TestUnknownEndpointIsSkipped) {
    broker.add_endpoint(endpoint("ddc-a1", "SiteA"));

    EndpointHealthSelector selector(broker, *logger);
    SiteEndpoints sites = selector.select({"ddc-missing", "ddc-a1"});

    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(broker.probe_count(), 2u);
}

TEST_F(EndpointSelectorTest, TestNoHealthyEndpointIsFatal) {
    FakeEndpoint down = endpoint("ddc-a1", "SiteA");
    down.broker_status = SubsystemStatus::FAILED;
    broker.add_endpoint(down);

    EndpointHealthSelector selector(broker, *logger);
    try {
        selector.select({"ddc-a1", "ddc-missing"});
        FAIL() << "Expected FatalError";
    } catch (const FatalError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_HEALTHY_ENDPOINT);
    }

    EXPECT_THROW(selector.select({}), FatalError);
}
