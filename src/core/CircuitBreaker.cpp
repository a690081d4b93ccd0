#include "CircuitBreaker.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "../utils/Utils.hpp"

std::string toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "unknown";
}

nlohmann::json toJson(const CircuitBreakerStats& stats) {
    nlohmann::json j = {
        {"name", stats.name},
        {"state", toString(stats.state)},
        {"consecutive_failures", stats.consecutive_failures},
        {"failure_threshold", stats.failure_threshold},
        {"recovery_timeout_ms", stats.recovery_timeout.count()},
        {"total_calls", stats.total_calls},
        {"total_successes", stats.total_successes},
        {"total_failures", stats.total_failures},
        {"total_rejected", stats.total_rejected},
        {"last_state_change", Utils::formatTimestamp(stats.last_state_change)}
    };
    j["opened_at"] = stats.opened_at ? nlohmann::json(Utils::formatTimestamp(*stats.opened_at)) : nlohmann::json(nullptr);
    return j;
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config,
                               std::shared_ptr<ILogger> logger,
                               std::shared_ptr<IStatsDClient> statsd_client,
                               std::shared_ptr<IClock> clock,
                               std::shared_ptr<IAlertSink> alert_sink)
    : config_(std::move(config)),
      logger_(logger),
      statsd_client_(statsd_client),
      clock_(clock),
      alert_sink_(alert_sink) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreaker");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for CircuitBreaker");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for CircuitBreaker");
    }
    if (config_.failure_threshold < 1) {
        throw std::invalid_argument("failure_threshold must be at least 1 for breaker " + config_.name);
    }
    if (config_.half_open_max_calls < 1) {
        throw std::invalid_argument("half_open_max_calls must be at least 1 for breaker " + config_.name);
    }
    last_state_change_ = clock_->systemNow();
}

std::optional<CircuitBreaker::Permit> CircuitBreaker::tryAcquire(std::string& rejection) {
    std::optional<Permit> permit;
    bool moved_to_half_open = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_calls_;

        if (state_ == CircuitState::OPEN) {
            auto elapsed = clock_->steadyNow() - *opened_at_;
            if (elapsed >= config_.recovery_timeout) {
                transitionLocked(CircuitState::HALF_OPEN);
                moved_to_half_open = true;
            } else {
                ++total_rejected_;
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(config_.recovery_timeout - elapsed);
                rejection = "Circuit breaker '" + config_.name + "' is OPEN. Retry after "
                    + std::to_string(remaining.count()) + "ms";
            }
        }

        if (rejection.empty()) {
            if (state_ == CircuitState::HALF_OPEN) {
                if (half_open_in_flight_ >= config_.half_open_max_calls) {
                    ++total_rejected_;
                    rejection = "Circuit breaker '" + config_.name + "' is HALF_OPEN (testing recovery)";
                } else {
                    ++half_open_in_flight_;
                    permit = Permit{generation_, true};
                }
            } else {
                permit = Permit{generation_, false};
            }
        }
    }

    if (moved_to_half_open) {
        announce(CircuitState::OPEN, CircuitState::HALF_OPEN, "recovery timeout elapsed");
    }
    if (!permit) {
        logger_->debug(rejection);
        statsd_client_->increment(MetricsDefinitions::BREAKER_REJECTED);
    }
    return permit;
}

void CircuitBreaker::onSuccess(const Permit& permit) {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_successes_;
        if (permit.generation != generation_) {
            return;
        }
        if (state_ == CircuitState::HALF_OPEN) {
            transitionLocked(CircuitState::CLOSED);
            closed = true;
        } else if (state_ == CircuitState::CLOSED) {
            consecutive_failures_ = 0;
        }
    }
    if (closed) {
        announce(CircuitState::HALF_OPEN, CircuitState::CLOSED, "trial call succeeded");
    }
}

void CircuitBreaker::onFailure(const Permit& permit, const std::string& error) {
    std::optional<CircuitState> opened_from;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++total_failures_;
        if (permit.generation != generation_) {
            return;
        }
        if (state_ == CircuitState::HALF_OPEN) {
            opened_from = CircuitState::HALF_OPEN;
            transitionLocked(CircuitState::OPEN);
        } else if (state_ == CircuitState::CLOSED) {
            failures = ++consecutive_failures_;
            if (consecutive_failures_ >= config_.failure_threshold) {
                opened_from = CircuitState::CLOSED;
                transitionLocked(CircuitState::OPEN);
            }
        }
    }

    if (opened_from) {
        std::string cause = (*opened_from == CircuitState::HALF_OPEN)
            ? "trial call failed: " + error
            : std::to_string(failures) + " consecutive failures, last: " + error;
        announce(*opened_from, CircuitState::OPEN, cause);
    } else {
        logger_->debug("Circuit " + config_.name + ": failure recorded (" + error + ")");
    }
}

void CircuitBreaker::transitionLocked(CircuitState to) {
    state_ = to;
    ++generation_;
    last_state_change_ = clock_->systemNow();
    half_open_in_flight_ = 0;

    switch (to) {
        case CircuitState::OPEN:
            opened_at_ = clock_->steadyNow();
            opened_at_wall_ = last_state_change_;
            break;
        case CircuitState::CLOSED:
            consecutive_failures_ = 0;
            opened_at_.reset();
            opened_at_wall_.reset();
            break;
        case CircuitState::HALF_OPEN:
            break;
    }
}

void CircuitBreaker::announce(CircuitState from, CircuitState to, const std::string& cause) {
    std::string message = "Circuit " + config_.name + ": " + toString(from) + " -> " + toString(to) + " (" + cause + ")";
    if (to == CircuitState::OPEN) {
        logger_->error(message);
        statsd_client_->increment(MetricsDefinitions::BREAKER_OPENED);
        if (config_.critical && alert_sink_) {
            Alert alert;
            alert.severity = AlertSeverity::CRITICAL;
            alert.source = "circuit_breaker";
            alert.summary = "Critical dependency '" + config_.name + "' is unreachable";
            alert.details = {{"breaker", config_.name}, {"from", toString(from)}, {"cause", cause}};
            alert_sink_->raise(alert);
        }
    } else {
        logger_->info(message);
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats stats;
    stats.name = config_.name;
    stats.state = state_;
    stats.consecutive_failures = consecutive_failures_;
    stats.failure_threshold = config_.failure_threshold;
    stats.recovery_timeout = config_.recovery_timeout;
    stats.opened_at = opened_at_wall_;
    stats.total_calls = total_calls_;
    stats.total_successes = total_successes_;
    stats.total_failures = total_failures_;
    stats.total_rejected = total_rejected_;
    stats.last_state_change = last_state_change_;
    return stats;
}

void CircuitBreaker::reset() {
    CircuitState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        transitionLocked(CircuitState::CLOSED);
        total_calls_ = 0;
        total_successes_ = 0;
        total_failures_ = 0;
        total_rejected_ = 0;
    }
    logger_->warn("Circuit " + config_.name + ": manual reset from " + toString(previous));
    statsd_client_->increment(MetricsDefinitions::BREAKER_RESET);
}
