#ifndef CONTROLPLANE_HPP
#define CONTROLPLANE_HPP

#include <atomic>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "CircuitBreakerRegistry.hpp"
#include "../budget/IdempotentBudgetController.hpp"
#include "../cache/IdempotencyStore.hpp"
#include "../config/AppConfig.hpp"
#include "../dlq/DeadLetterQueue.hpp"
#include "../dlq/RetryWorker.hpp"
#include "../governance/GovernanceLimiter.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IAlertSink.hpp"
#include "../interfaces/IBudgetLedger.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/IDeadLetterStore.hpp"
#include "../interfaces/IGovernanceStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace net = boost::asio;

// Builds every reliability component from one AppConfig and runs the periodic
// housekeeping (reservation sweep, breaker stats report) on the caller's io_context.
class ControlPlane {
public:
    ControlPlane(net::io_context& ioc,
                 const AppConfig& config,
                 std::shared_ptr<CacheInterface> cache,
                 std::shared_ptr<IStatsDClient> statsd_client,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IClock> clock,
                 std::shared_ptr<IAlertSink> alert_sink);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    void start();
    void shutdown();

    CircuitBreakerRegistry& breakers() { return *breakers_; }
    IdempotentBudgetController& budget() { return *budget_; }
    DeadLetterQueue& deadLetters() { return *dead_letters_; }
    RetryWorker& worker() { return *worker_; }
    GovernanceLimiter& governance() { return *governance_; }

    // One round of each housekeeping task; the timers call these.
    int sweepReservations();
    void reportStats();

private:
    void armSweepTimer();
    void armStatsTimer();

    const AppConfig config_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;

    std::shared_ptr<CircuitBreakerRegistry> breakers_;
    std::shared_ptr<IdempotencyStore> idempotency_;
    std::shared_ptr<IBudgetLedger> ledger_;
    std::shared_ptr<IdempotentBudgetController> budget_;
    std::shared_ptr<IDeadLetterStore> dead_letter_store_;
    std::shared_ptr<RetryWorker> worker_;
    std::shared_ptr<DeadLetterQueue> dead_letters_;
    std::shared_ptr<IGovernanceStore> governance_store_;
    std::shared_ptr<GovernanceLimiter> governance_;

    net::steady_timer sweep_timer_;
    net::steady_timer stats_timer_;
    std::atomic<bool> running_{false};
};

#endif // CONTROLPLANE_HPP
