// tests/test_circuitbreaker.cpp
#include <chrono>
#include <memory>
#include <stdexcept>
#include <set>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/config/AppConfig.hpp"
#include "../src/core/CircuitBreaker.hpp"
#include "../src/core/CircuitBreakerRegistry.hpp"

using ::testing::_;
using ::testing::NiceMock;

namespace {
CallResult<int> succeed() {
    return CallResult<int>::ok(42);
}

CallResult<int> fail() {
    return CallResult<int>::failure("dependency down");
}
}

class CircuitBreakerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<MockAlertSink> alerts = std::make_shared<MockAlertSink>();

    std::unique_ptr<CircuitBreaker> makeBreaker(int threshold = 3, bool critical = false) {
        CircuitBreakerConfig config;
        config.name = "llm_api";
        config.failure_threshold = threshold;
        config.recovery_timeout = std::chrono::milliseconds(30000);
        config.critical = critical;
        return std::make_unique<CircuitBreaker>(config, logger, statsd, clock, alerts);
    }
};

TEST_F(CircuitBreakerTest, ClosedPassesCallsThrough) {
    auto breaker = makeBreaker();
    auto result = breaker->call(succeed);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(breaker->state(), CircuitState::CLOSED);

    auto stats = breaker->stats();
    EXPECT_EQ(stats.total_calls, 1u);
    EXPECT_EQ(stats.total_successes, 1u);
    EXPECT_FALSE(stats.opened_at.has_value());
}

TEST_F(CircuitBreakerTest, OpensAfterThresholdAndSkipsOperation) {
    auto breaker = makeBreaker(3);
    for (int i = 0; i < 3; ++i) {
        auto result = breaker->call(fail);
        EXPECT_EQ(result.status(), CallStatus::Failed);
    }
    EXPECT_EQ(breaker->state(), CircuitState::OPEN);

    int invocations = 0;
    auto result = breaker->call([&invocations] {
        ++invocations;
        return CallResult<int>::ok(1);
    });
    EXPECT_TRUE(result.isCircuitOpen());
    EXPECT_EQ(invocations, 0);

    auto stats = breaker->stats();
    EXPECT_EQ(stats.total_rejected, 1u);
    EXPECT_TRUE(stats.opened_at.has_value());
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    auto breaker = makeBreaker(3);
    breaker->call(fail);
    breaker->call(fail);
    breaker->call(succeed);
    breaker->call(fail);
    breaker->call(fail);
    EXPECT_EQ(breaker->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker->stats().consecutive_failures, 2);
}

TEST_F(CircuitBreakerTest, StaysOpenUntilRecoveryTimeoutElapses) {
    auto breaker = makeBreaker(1);
    breaker->call(fail);
    ASSERT_EQ(breaker->state(), CircuitState::OPEN);

    clock->advance(std::chrono::milliseconds(29999));
    EXPECT_TRUE(breaker->call(succeed).isCircuitOpen());
    EXPECT_EQ(breaker->state(), CircuitState::OPEN);
}

TEST_F(CircuitBreakerTest, TrialSuccessClosesBreaker) {
    auto breaker = makeBreaker(2);
    breaker->call(fail);
    breaker->call(fail);
    clock->advance(std::chrono::seconds(30));

    auto result = breaker->call(succeed);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(breaker->state(), CircuitState::CLOSED);
    auto stats = breaker->stats();
    EXPECT_EQ(stats.consecutive_failures, 0);
    EXPECT_FALSE(stats.opened_at.has_value());
}

TEST_F(CircuitBreakerTest, TrialFailureReopensWithNewOpenedAt) {
    auto breaker = makeBreaker(1);
    breaker->call(fail);
    auto first_opened = breaker->stats().opened_at;
    ASSERT_TRUE(first_opened.has_value());

    clock->advance(std::chrono::seconds(31));
    EXPECT_EQ(breaker->call(fail).status(), CallStatus::Failed);
    EXPECT_EQ(breaker->state(), CircuitState::OPEN);

    auto reopened = breaker->stats().opened_at;
    ASSERT_TRUE(reopened.has_value());
    EXPECT_EQ(*reopened - *first_opened, std::chrono::seconds(31));

    // A fresh recovery window starts from the trial failure.
    clock->advance(std::chrono::seconds(10));
    EXPECT_TRUE(breaker->call(succeed).isCircuitOpen());
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsSingleTrial) {
    auto breaker = makeBreaker(1);
    breaker->call(fail);
    clock->advance(std::chrono::seconds(30));

    CallStatus concurrent_status = CallStatus::Ok;
    auto trial = breaker->call([&] {
        // A second caller arriving while the trial is still running.
        concurrent_status = breaker->call(succeed).status();
        return CallResult<int>::ok(7);
    });

    EXPECT_TRUE(trial.isOk());
    EXPECT_EQ(concurrent_status, CallStatus::CircuitOpen);
    EXPECT_EQ(breaker->state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, OutcomeFromEarlierEpisodeDoesNotDriveTransitions) {
    auto breaker = makeBreaker(1);
    auto result = breaker->call([&] {
        breaker->reset();
        return CallResult<int>::failure("late failure");
    });

    EXPECT_EQ(result.status(), CallStatus::Failed);
    EXPECT_EQ(breaker->state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker->stats().total_failures, 1u);
}

TEST_F(CircuitBreakerTest, ThrowingOperationCountsAsFailureAndPropagates) {
    auto breaker = makeBreaker(1);
    EXPECT_THROW(breaker->call([]() -> CallResult<int> {
        throw std::runtime_error("socket closed");
    }), std::runtime_error);
    EXPECT_EQ(breaker->state(), CircuitState::OPEN);
}

TEST_F(CircuitBreakerTest, ExecuteThrowsTypedErrors) {
    auto breaker = makeBreaker(1);
    EXPECT_EQ(breaker->execute(succeed), 42);
    EXPECT_THROW(breaker->execute(fail), OperationFailedError);

    try {
        breaker->execute(succeed);
        FAIL() << "expected CircuitOpenError";
    } catch (const CircuitOpenError& e) {
        EXPECT_EQ(e.breaker(), "llm_api");
        EXPECT_THAT(e.what(), ::testing::HasSubstr("is OPEN"));
    }
}

TEST_F(CircuitBreakerTest, CriticalBreakerRaisesAlertWhenOpening) {
    auto breaker = makeBreaker(2, true);
    EXPECT_CALL(*alerts, raise(::testing::Field(&Alert::severity, AlertSeverity::CRITICAL))).Times(1);
    EXPECT_CALL(*statsd, increment(_, _)).Times(::testing::AnyNumber());
    EXPECT_CALL(*statsd, increment(MetricsDefinitions::BREAKER_OPENED, 1)).Times(1);

    breaker->call(fail);
    breaker->call(fail);
    breaker->call(fail); // fast-failed, no second alert
}

TEST_F(CircuitBreakerTest, NonCriticalBreakerDoesNotAlert) {
    auto breaker = makeBreaker(1, false);
    EXPECT_CALL(*alerts, raise(_)).Times(0);
    breaker->call(fail);
    EXPECT_EQ(breaker->state(), CircuitState::OPEN);
}

TEST_F(CircuitBreakerTest, ResetClearsStateAndCounters) {
    auto breaker = makeBreaker(1);
    breaker->call(fail);
    breaker->call(succeed);
    breaker->reset();

    auto stats = breaker->stats();
    EXPECT_EQ(stats.state, CircuitState::CLOSED);
    EXPECT_EQ(stats.consecutive_failures, 0);
    EXPECT_EQ(stats.total_calls, 0u);
    EXPECT_EQ(stats.total_failures, 0u);
    EXPECT_EQ(stats.total_rejected, 0u);
    EXPECT_FALSE(stats.opened_at.has_value());
}

TEST_F(CircuitBreakerTest, StatsSerialiseToJson) {
    auto breaker = makeBreaker(1);
    breaker->call(fail);
    auto j = toJson(breaker->stats());
    EXPECT_EQ(j["name"], "llm_api");
    EXPECT_EQ(j["state"], "open");
    EXPECT_EQ(j["total_failures"], 1);
    EXPECT_EQ(j["recovery_timeout_ms"], 30000);
    EXPECT_TRUE(j["opened_at"].is_string());
}

TEST_F(CircuitBreakerTest, RejectsInvalidConfig) {
    CircuitBreakerConfig config;
    config.failure_threshold = 0;
    EXPECT_THROW(std::make_unique<CircuitBreaker>(config, logger, statsd, clock), std::invalid_argument);
}

// --- Registry ---

class CircuitBreakerRegistryTest : public CircuitBreakerTest {
protected:
    std::unique_ptr<CircuitBreakerRegistry> makeRegistry() {
        CircuitBreakerConfig defaults;
        defaults.failure_threshold = 2;
        return std::make_unique<CircuitBreakerRegistry>(
            defaults, std::set<std::string>{"postgres"}, logger, statsd, clock, alerts);
    }
};

TEST_F(CircuitBreakerRegistryTest, GetOrCreateReturnsSameInstance) {
    auto registry = makeRegistry();
    auto first = registry->getOrCreate("llm_api");
    auto second = registry->getOrCreate("llm_api");
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->config().failure_threshold, 2);
    EXPECT_EQ(first->name(), "llm_api");
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(CircuitBreakerRegistryTest, CriticalDependenciesAreFlagged) {
    auto registry = makeRegistry();
    EXPECT_TRUE(registry->getOrCreate("postgres")->config().critical);
    EXPECT_FALSE(registry->getOrCreate("redis")->config().critical);
}

TEST_F(CircuitBreakerRegistryTest, GetUnknownReturnsNull) {
    auto registry = makeRegistry();
    EXPECT_EQ(registry->get("missing"), nullptr);
}

TEST_F(CircuitBreakerRegistryTest, RegisterReplacesExistingBreaker) {
    auto registry = makeRegistry();
    auto original = registry->getOrCreate("nats");
    CircuitBreakerConfig config;
    config.name = "nats";
    config.failure_threshold = 10;
    auto replacement = std::make_shared<CircuitBreaker>(config, logger, statsd, clock);
    registry->registerBreaker("nats", replacement);

    EXPECT_EQ(registry->get("nats"), replacement);
    EXPECT_NE(registry->get("nats"), original);
    EXPECT_THROW(registry->registerBreaker("nats", nullptr), std::invalid_argument);
}

TEST_F(CircuitBreakerRegistryTest, ResetAllAndStats) {
    auto registry = makeRegistry();
    auto a = registry->getOrCreate("a");
    auto b = registry->getOrCreate("b");
    a->call(fail);
    a->call(fail);
    ASSERT_EQ(a->state(), CircuitState::OPEN);

    auto stats = registry->allStats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats.at("a").state, CircuitState::OPEN);
    EXPECT_EQ(stats.at("b").state, CircuitState::CLOSED);

    EXPECT_EQ(registry->resetAll(), 2u);
    EXPECT_EQ(a->state(), CircuitState::CLOSED);
}
