// tests/test_deadletter.cpp
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/core/Errors.hpp"
#include "../src/dlq/DeadLetterQueue.hpp"
#include "../src/dlq/InMemoryDeadLetterStore.hpp"
#include "../src/dlq/RetryPolicy.hpp"
#include "../src/dlq/RetryWorker.hpp"

using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Throw;

namespace {
// Polls until pred holds or the deadline passes.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds deadline = std::chrono::milliseconds(3000)) {
    auto until = std::chrono::steady_clock::now() + deadline;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
}

// --- RetryPolicy ---

TEST(RetryPolicyTest, BackoffDoublesUpToCap) {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(500);
    policy.max_delay = std::chrono::milliseconds(3000);

    EXPECT_EQ(policy.backoffFor(1), std::chrono::milliseconds(500));
    EXPECT_EQ(policy.backoffFor(2), std::chrono::milliseconds(1000));
    EXPECT_EQ(policy.backoffFor(3), std::chrono::milliseconds(2000));
    EXPECT_EQ(policy.backoffFor(4), std::chrono::milliseconds(3000));
    EXPECT_EQ(policy.backoffFor(40), std::chrono::milliseconds(3000));
    EXPECT_THROW(policy.backoffFor(0), std::invalid_argument);
}

TEST(RetryPolicyTest, ExhaustedAtMaxAttempts) {
    RetryPolicy policy;
    policy.max_attempts = 3;
    EXPECT_FALSE(policy.exhausted(2));
    EXPECT_TRUE(policy.exhausted(3));
}

// --- DeadLetterQueue with a mocked transport ---

class DeadLetterQueueTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<NiceMock<MockAlertSink>> alerts = std::make_shared<NiceMock<MockAlertSink>>();
    std::shared_ptr<MockMessageTransport> transport = std::make_shared<MockMessageTransport>();
    std::shared_ptr<InMemoryDeadLetterStore> store = std::make_shared<InMemoryDeadLetterStore>();
    std::unique_ptr<DeadLetterQueue> dlq;

    void SetUp() override {
        dlq = std::make_unique<DeadLetterQueue>(store, transport, alerts, statsd, logger, clock, 5);
    }
};

TEST_F(DeadLetterQueueTest, EnqueueStoresUnresolvedMessageAndAlerts) {
    EXPECT_CALL(*alerts, raise(Field(&Alert::source, "dead_letter_queue"))).Times(1);

    nlohmann::json payload = {{"task_id", "t-1"}, {"step", "summarise"}};
    std::string id = dlq->enqueue("agent.tasks", payload, "timeout after 30s");

    auto message = dlq->get(id);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->original_destination, "agent.tasks");
    EXPECT_EQ(message->payload, payload);
    EXPECT_EQ(message->last_error, "timeout after 30s");
    EXPECT_EQ(message->attempt_count, 5);
    EXPECT_FALSE(message->resolved);
    EXPECT_EQ(dlq->countUnresolved(), 1u);
}

TEST_F(DeadLetterQueueTest, RequeueRepublishesOnce) {
    nlohmann::json payload = {{"task_id", "t-2"}};
    std::string id = dlq->enqueue("agent.tasks", payload, "boom");

    EXPECT_CALL(*transport, publish("agent.tasks", payload)).Times(1);

    auto first = dlq->resolve(id, "fixed upstream", true);
    EXPECT_EQ(first.status, ResolveStatus::RESOLVED);
    EXPECT_TRUE(first.requeued);

    auto message = dlq->get(id);
    ASSERT_TRUE(message.has_value());
    EXPECT_TRUE(message->resolved);
    EXPECT_TRUE(message->requeued);
    EXPECT_EQ(message->attempt_count, 0);
    EXPECT_EQ(message->resolution_note, "fixed upstream");
    EXPECT_TRUE(message->resolved_at.has_value());

    auto second = dlq->resolve(id, "again", true);
    EXPECT_EQ(second.status, ResolveStatus::ALREADY_RESOLVED);
    EXPECT_EQ(dlq->countUnresolved(), 0u);
}

TEST_F(DeadLetterQueueTest, ResolveWithoutRequeueDoesNotPublish) {
    std::string id = dlq->enqueue("agent.tasks", {{"task_id", "t-3"}}, "bad payload");
    EXPECT_CALL(*transport, publish(_, _)).Times(0);

    auto result = dlq->resolve(id, "discarded", false);
    EXPECT_EQ(result.status, ResolveStatus::RESOLVED);
    EXPECT_FALSE(result.requeued);
    EXPECT_EQ(dlq->get(id)->attempt_count, 5);
}

TEST_F(DeadLetterQueueTest, FailedRequeueLeavesMessageUnresolved) {
    std::string id = dlq->enqueue("agent.tasks", {{"task_id", "t-4"}}, "boom");
    EXPECT_CALL(*transport, publish(_, _)).WillOnce(Throw(std::runtime_error("broker down")));

    EXPECT_THROW(dlq->resolve(id, "retry", true), std::runtime_error);
    auto message = dlq->get(id);
    ASSERT_TRUE(message.has_value());
    EXPECT_FALSE(message->resolved);
    EXPECT_EQ(dlq->countUnresolved(), 1u);
}

TEST_F(DeadLetterQueueTest, UnknownMessageIsRejected) {
    EXPECT_THROW(dlq->resolve("missing", "", false), ValidationError);
    EXPECT_FALSE(dlq->get("missing").has_value());
}

TEST_F(DeadLetterQueueTest, ListIsNewestFirstWithFilters) {
    std::string first = dlq->enqueue("a", {{"n", 1}}, "e1");
    clock->advance(std::chrono::seconds(1));
    std::string second = dlq->enqueue("b", {{"n", 2}}, "e2");
    clock->advance(std::chrono::seconds(1));
    std::string third = dlq->enqueue("c", {{"n", 3}}, "e3");
    dlq->resolve(second, "dropped", false);

    auto all = dlq->list(std::nullopt);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, third);
    EXPECT_EQ(all[1].id, second);
    EXPECT_EQ(all[2].id, first);

    auto open = dlq->list(false);
    ASSERT_EQ(open.size(), 2u);
    EXPECT_EQ(open[0].id, third);
    EXPECT_EQ(open[1].id, first);

    auto resolved = dlq->list(true);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].id, second);

    auto page = dlq->list(std::nullopt, 1, 1);
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].id, second);
}

TEST_F(DeadLetterQueueTest, DuplicateIdIsRejectedByStore) {
    DeadLetterMessage message;
    message.id = "fixed-id";
    message.original_destination = "a";
    store->insert(message);
    EXPECT_THROW(store->insert(message), ValidationError);
}

// --- RetryWorker feeding the DeadLetterQueue ---

class RetryWorkerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<NiceMock<MockAlertSink>> alerts = std::make_shared<NiceMock<MockAlertSink>>();
    std::shared_ptr<InMemoryDeadLetterStore> store = std::make_shared<InMemoryDeadLetterStore>();
    std::shared_ptr<RetryWorker> worker;
    std::shared_ptr<DeadLetterQueue> dlq;

    void SetUp() override {
        RetryPolicy policy;
        policy.base_delay = std::chrono::milliseconds(1);
        policy.max_delay = std::chrono::milliseconds(4);
        policy.max_attempts = 3;
        worker = std::make_shared<RetryWorker>(policy, logger, statsd, clock);
        dlq = std::make_shared<DeadLetterQueue>(store, worker, alerts, statsd, logger, clock, policy.max_attempts);
        std::weak_ptr<DeadLetterQueue> weak_dlq = dlq;
        worker->onExhausted([weak_dlq](const WorkItem& item) {
            if (auto queue = weak_dlq.lock()) {
                queue->park(item);
            }
        });
    }

    void TearDown() override {
        worker->stop();
    }
};

TEST_F(RetryWorkerTest, DeliversToRegisteredHandler) {
    std::atomic<int> delivered{0};
    worker->registerHandler("agent.tasks", [&](const WorkItem& item) {
        EXPECT_EQ(item.attempt_count, 0);
        EXPECT_EQ(item.payload["task_id"], "t-1");
        ++delivered;
    });
    worker->start(2);

    worker->publish("agent.tasks", {{"task_id", "t-1"}});
    ASSERT_TRUE(waitFor([&] { return delivered.load() == 1 && worker->pending() == 0; }));
    EXPECT_EQ(dlq->countUnresolved(), 0u);
}

TEST_F(RetryWorkerTest, TransientFailureSucceedsOnRetry) {
    std::atomic<int> calls{0};
    worker->registerHandler("agent.tasks", [&](const WorkItem& item) {
        if (++calls < 2) {
            throw std::runtime_error("connection refused");
        }
        EXPECT_EQ(item.attempt_count, 1);
    });
    worker->start(1);

    worker->publish("agent.tasks", {{"task_id", "t-2"}});
    ASSERT_TRUE(waitFor([&] { return worker->pending() == 0; }));
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(dlq->countUnresolved(), 0u);
}

TEST_F(RetryWorkerTest, ExhaustedItemIsDeadLetteredWithAlert) {
    std::atomic<int> calls{0};
    worker->registerHandler("agent.tasks", [&](const WorkItem&) {
        ++calls;
        throw std::runtime_error("handler exploded");
    });
    EXPECT_CALL(*alerts, raise(Field(&Alert::severity, AlertSeverity::CRITICAL))).Times(1);
    worker->start(2);

    worker->publish("agent.tasks", {{"task_id", "t-3"}});
    ASSERT_TRUE(waitFor([&] { return dlq->countUnresolved() == 1; }));
    ASSERT_TRUE(waitFor([&] { return worker->pending() == 0; }));

    EXPECT_EQ(calls.load(), 3);
    auto parked = dlq->list(false);
    ASSERT_EQ(parked.size(), 1u);
    EXPECT_EQ(parked[0].original_destination, "agent.tasks");
    EXPECT_EQ(parked[0].attempt_count, 3);
    EXPECT_EQ(parked[0].max_attempts, 3);
    EXPECT_EQ(parked[0].last_error, "handler exploded");
    EXPECT_EQ(parked[0].payload["task_id"], "t-3");
    EXPECT_FALSE(parked[0].resolved);
}

TEST_F(RetryWorkerTest, MissingHandlerCountsAsFailure) {
    worker->start(1);
    worker->publish("nowhere", {{"task_id", "t-4"}});

    ASSERT_TRUE(waitFor([&] { return dlq->countUnresolved() == 1; }));
    auto parked = dlq->list(false);
    ASSERT_EQ(parked.size(), 1u);
    EXPECT_EQ(parked[0].last_error, "no handler for destination nowhere");
}

TEST_F(RetryWorkerTest, RequeuedMessageRunsAgainFromScratch) {
    std::atomic<bool> healthy{false};
    std::atomic<int> successes{0};
    worker->registerHandler("agent.tasks", [&](const WorkItem& item) {
        if (!healthy) {
            throw std::runtime_error("still broken");
        }
        EXPECT_EQ(item.attempt_count, 0);
        ++successes;
    });
    worker->start(1);

    worker->publish("agent.tasks", {{"task_id", "t-5"}});
    ASSERT_TRUE(waitFor([&] { return dlq->countUnresolved() == 1; }));
    std::string id = dlq->list(false).at(0).id;

    healthy = true;
    EXPECT_EQ(dlq->resolve(id, "dependency restored", true).status, ResolveStatus::RESOLVED);
    ASSERT_TRUE(waitFor([&] { return successes.load() == 1; }));
    EXPECT_EQ(dlq->countUnresolved(), 0u);
}

TEST_F(RetryWorkerTest, PublishAfterStopThrows) {
    worker->start(1);
    worker->stop();
    EXPECT_THROW(worker->publish("agent.tasks", {{"task_id", "t-6"}}), std::runtime_error);
}

TEST_F(RetryWorkerTest, NonStandardExceptionCountsAsFailure) {
    worker->registerHandler("agent.tasks", [](const WorkItem&) {
        throw 42;
    });
    worker->start(1);

    worker->publish("agent.tasks", {{"task_id", "t-7"}});
    ASSERT_TRUE(waitFor([&] { return dlq->countUnresolved() == 1; }));
    ASSERT_TRUE(waitFor([&] { return worker->pending() == 0; }));
    auto parked = dlq->list(false);
    ASSERT_EQ(parked.size(), 1u);
    EXPECT_EQ(parked[0].attempt_count, 3);
    EXPECT_EQ(parked[0].last_error, "non-standard exception");
}

TEST_F(RetryWorkerTest, StopDeadLettersItemsWaitingForRetry) {
    RetryPolicy slow;
    slow.base_delay = std::chrono::seconds(30);
    slow.max_delay = std::chrono::seconds(60);
    slow.max_attempts = 5;
    auto slow_worker = std::make_shared<RetryWorker>(slow, logger, statsd, clock);
    auto slow_dlq = std::make_shared<DeadLetterQueue>(store, slow_worker, alerts, statsd, logger, clock, slow.max_attempts);
    std::weak_ptr<DeadLetterQueue> weak_dlq = slow_dlq;
    slow_worker->onExhausted([weak_dlq](const WorkItem& item) {
        if (auto queue = weak_dlq.lock()) {
            queue->park(item);
        }
    });

    std::atomic<int> calls{0};
    slow_worker->registerHandler("agent.tasks", [&](const WorkItem&) {
        ++calls;
        throw std::runtime_error("upstream timeout");
    });
    EXPECT_CALL(*alerts, raise(Field(&Alert::severity, AlertSeverity::CRITICAL))).Times(1);
    slow_worker->start(1);

    slow_worker->publish("agent.tasks", {{"task_id", "t-8"}});
    ASSERT_TRUE(waitFor([&] { return calls.load() == 1; }));

    slow_worker->stop();
    EXPECT_EQ(slow_worker->pending(), 0u);
    EXPECT_EQ(calls.load(), 1);
    ASSERT_EQ(slow_dlq->countUnresolved(), 1u);
    auto parked = slow_dlq->list(false);
    ASSERT_EQ(parked.size(), 1u);
    EXPECT_EQ(parked[0].attempt_count, 1);
    EXPECT_EQ(parked[0].payload["task_id"], "t-8");
    EXPECT_EQ(parked[0].last_error, "worker stopped before retry: upstream timeout");
}
