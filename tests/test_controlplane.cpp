// tests/test_controlplane.cpp
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <boost/asio/io_context.hpp>

#include "TestMocks.hpp"
#include "../src/cache/InMemoryCache.hpp"
#include "../src/core/ControlPlane.hpp"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class ControlPlaneTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<NiceMock<MockAlertSink>> alerts = std::make_shared<NiceMock<MockAlertSink>>();
    std::shared_ptr<InMemoryCache> cache = std::make_shared<InMemoryCache>(300, 1000);
    boost::asio::io_context ioc;
    AppConfig config;

    void SetUp() override {
        config.use_redis = false;
        config.default_token_limit = 2000;
        config.reservation_max_age_seconds = 600;
        config.critical_dependencies = {"postgres"};
        config.dlq_max_attempts = 2;
        config.retry_base_delay_millis = 1;
        config.retry_max_delay_millis = 2;
        config.worker_threads = 1;
    }

    std::unique_ptr<ControlPlane> makeControlPlane() {
        return std::make_unique<ControlPlane>(ioc, config, cache, statsd, logger, clock, alerts);
    }
};

TEST_F(ControlPlaneTest, ComponentsFollowConfiguration) {
    auto plane = makeControlPlane();

    EXPECT_TRUE(plane->breakers().getOrCreate("postgres")->config().critical);
    EXPECT_FALSE(plane->breakers().getOrCreate("llm_api")->config().critical);
    EXPECT_EQ(plane->budget().budgetState("acme", "search").total, 2000);
    EXPECT_EQ(plane->worker().policy().max_attempts, 2);
    EXPECT_EQ(plane->governance().allStatuses().size(), config.governance_rules.size());
}

TEST_F(ControlPlaneTest, SweepReleasesAbandonedReservations) {
    auto plane = makeControlPlane();
    TokenRequest request;
    request.tenant_id = "acme";
    request.project_id = "search";
    request.task_id = "task-1";
    request.model = "claude-sonnet";
    request.estimated_tokens = 500;
    request.request_id = "req-1";
    request.purpose = "planning";
    ASSERT_TRUE(plane->budget().requestTokens(request).approved);

    EXPECT_EQ(plane->sweepReservations(), 0);
    clock->advance(std::chrono::minutes(11));
    EXPECT_EQ(plane->sweepReservations(), 1);
    EXPECT_EQ(plane->budget().budgetState("acme", "search").available, 2000);
}

TEST_F(ControlPlaneTest, ExhaustedWorkLandsInDeadLetters) {
    auto plane = makeControlPlane();
    EXPECT_CALL(*alerts, raise(_)).Times(1);
    plane->start();

    plane->worker().publish("unregistered.destination", {{"task_id", "t-1"}});

    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (plane->deadLetters().countUnresolved() == 0 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(plane->deadLetters().countUnresolved(), 1u);
    until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (plane->worker().pending() > 0 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    plane->shutdown();
}

TEST_F(ControlPlaneTest, StatsReportCountsOpenBreakers) {
    auto plane = makeControlPlane();
    auto breaker = plane->breakers().getOrCreate("llm_api");
    for (int i = 0; i < config.breaker_failure_threshold; ++i) {
        breaker->call([] { return CallResult<int>::failure("503"); });
    }
    ASSERT_EQ(breaker->state(), CircuitState::OPEN);

    EXPECT_CALL(*statsd, gauge(MetricsDefinitions::BREAKERS_OPEN, 1.0)).Times(1);
    EXPECT_CALL(*logger, info(HasSubstr("\"llm_api\""))).Times(1);
    plane->reportStats();
}

TEST_F(ControlPlaneTest, ShutdownFlushesMetricsOnce) {
    auto plane = makeControlPlane();
    EXPECT_CALL(*statsd, flush()).Times(1);
    plane->start();
    plane->shutdown();
    plane->shutdown();
}
