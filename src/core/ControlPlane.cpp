#include "ControlPlane.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../budget/InMemoryBudgetLedger.hpp"
#include "../dlq/InMemoryDeadLetterStore.hpp"
#include "../governance/InMemoryGovernanceStore.hpp"

ControlPlane::ControlPlane(net::io_context& ioc,
                           const AppConfig& config,
                           std::shared_ptr<CacheInterface> cache,
                           std::shared_ptr<IStatsDClient> statsd_client,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<IAlertSink> alert_sink)
    : config_(config),
      statsd_client_(statsd_client),
      logger_(logger),
      clock_(clock),
      sweep_timer_(ioc),
      stats_timer_(ioc) {
    if (!cache) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock pointer cannot be null");
    }
    if (!alert_sink) {
        throw std::invalid_argument("AlertSink pointer cannot be null");
    }

    CircuitBreakerConfig breaker_defaults;
    breaker_defaults.failure_threshold = config_.breaker_failure_threshold;
    breaker_defaults.recovery_timeout = std::chrono::milliseconds(config_.breaker_recovery_timeout_millis);
    breaker_defaults.half_open_max_calls = config_.breaker_half_open_max_calls;
    breakers_ = std::make_shared<CircuitBreakerRegistry>(
        breaker_defaults, config_.critical_dependencies, logger_, statsd_client_, clock_, alert_sink);

    idempotency_ = std::make_shared<IdempotencyStore>(cache, logger_, config_.idempotency_ttl_seconds);
    ledger_ = std::make_shared<InMemoryBudgetLedger>(logger_, clock_);
    budget_ = std::make_shared<IdempotentBudgetController>(ledger_, idempotency_, statsd_client_, config_, logger_, clock_);

    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(config_.retry_base_delay_millis);
    policy.max_delay = std::chrono::milliseconds(config_.retry_max_delay_millis);
    policy.max_attempts = config_.dlq_max_attempts;
    worker_ = std::make_shared<RetryWorker>(policy, logger_, statsd_client_, clock_);

    dead_letter_store_ = std::make_shared<InMemoryDeadLetterStore>();
    dead_letters_ = std::make_shared<DeadLetterQueue>(
        dead_letter_store_, worker_, alert_sink, statsd_client_, logger_, clock_, config_.dlq_max_attempts);
    std::weak_ptr<DeadLetterQueue> weak_dlq = dead_letters_;
    worker_->onExhausted([weak_dlq](const WorkItem& item) {
        if (auto dlq = weak_dlq.lock()) {
            dlq->park(item);
        } else {
            throw std::runtime_error("dead-letter queue is gone");
        }
    });

    governance_store_ = std::make_shared<InMemoryGovernanceStore>(config_.governance_rules);
    governance_ = std::make_shared<GovernanceLimiter>(governance_store_, statsd_client_, logger_, clock_);

    logger_->setup("ControlPlane initialized");
}

ControlPlane::~ControlPlane() {
    shutdown();
}

void ControlPlane::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_->start(static_cast<size_t>(config_.worker_threads));
    armSweepTimer();
    armStatsTimer();
    logger_->setup("ControlPlane started");
}

void ControlPlane::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    logger_->setup("ControlPlane shutting down...");
    sweep_timer_.cancel();
    stats_timer_.cancel();
    worker_->stop();
    statsd_client_->flush();
}

int ControlPlane::sweepReservations() {
    try {
        return budget_->sweepExpiredReservations(std::chrono::seconds(config_.reservation_max_age_seconds));
    } catch (const std::exception& e) {
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        logger_->error("Reservation sweep failed: " + std::string(e.what()));
        return 0;
    }
}

void ControlPlane::reportStats() {
    nlohmann::json report = nlohmann::json::object();
    int open = 0;
    for (const auto& [name, stats] : breakers_->allStats()) {
        report[name] = toJson(stats);
        if (stats.state != CircuitState::CLOSED) {
            ++open;
        }
    }
    statsd_client_->gauge(MetricsDefinitions::BREAKERS_OPEN, open);
    logger_->info("Circuit breaker stats: " + report.dump());

    size_t unresolved = dead_letters_->countUnresolved();
    if (unresolved > 0) {
        logger_->warn(std::to_string(unresolved) + " unresolved dead letters");
    }
}

void ControlPlane::armSweepTimer() {
    sweep_timer_.expires_after(std::chrono::seconds(config_.reservation_sweep_interval_seconds));
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        sweepReservations();
        armSweepTimer();
    });
}

void ControlPlane::armStatsTimer() {
    stats_timer_.expires_after(std::chrono::seconds(config_.stats_report_interval_seconds));
    stats_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        reportStats();
        armStatsTimer();
    });
}
