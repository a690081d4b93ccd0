#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "CallResult.hpp"
#include "Errors.hpp"
#include "../config/AppConfig.hpp" // For MetricsDefinitions
#include "../interfaces/IAlertSink.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

std::string toString(CircuitState state);

struct CircuitBreakerConfig {
    std::string name = "default";
    int failure_threshold = 5;
    std::chrono::milliseconds recovery_timeout{30000};
    // Concurrent trial calls admitted while HALF_OPEN.
    int half_open_max_calls = 1;
    // Entering OPEN raises a critical alert.
    bool critical = false;
};

struct CircuitBreakerStats {
    std::string name;
    CircuitState state = CircuitState::CLOSED;
    int consecutive_failures = 0;
    int failure_threshold = 0;
    std::chrono::milliseconds recovery_timeout{0};
    std::optional<std::chrono::system_clock::time_point> opened_at;
    uint64_t total_calls = 0;
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
    uint64_t total_rejected = 0;
    std::chrono::system_clock::time_point last_state_change;
};

nlohmann::json toJson(const CircuitBreakerStats& stats);

// Three-state breaker guarding one downstream dependency.
//
// CLOSED executes every call and opens after failure_threshold consecutive
// failures. OPEN rejects without invoking the operation until recovery_timeout
// has elapsed since opened_at; the check happens lazily on the next call, which
// moves the breaker to HALF_OPEN. HALF_OPEN admits half_open_max_calls trials:
// a trial success closes the breaker, a trial failure re-opens it.
class CircuitBreaker {
public:
    CircuitBreaker(CircuitBreakerConfig config,
                   std::shared_ptr<ILogger> logger,
                   std::shared_ptr<IStatsDClient> statsd_client,
                   std::shared_ptr<IClock> clock,
                   std::shared_ptr<IAlertSink> alert_sink = nullptr);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // op must return CallResult<T>. A fast-fail comes back as CallStatus::CircuitOpen
    // without op being invoked. Exceptions thrown by op are recorded as failures and
    // propagate unchanged.
    template <typename Fn>
    auto call(Fn&& op) -> std::invoke_result_t<Fn&> {
        using Result = std::invoke_result_t<Fn&>;

        std::string rejection;
        std::optional<Permit> permit = tryAcquire(rejection);
        if (!permit) {
            return Result::circuitOpen(rejection);
        }

        try {
            Result result = op();
            if (result.isOk()) {
                onSuccess(*permit);
            } else {
                onFailure(*permit, result.error());
            }
            return result;
        } catch (const std::exception& e) {
            onFailure(*permit, e.what());
            throw;
        } catch (...) {
            onFailure(*permit, "non-standard exception");
            throw;
        }
    }

    // Throwing flavour of call(): returns the value, throws CircuitOpenError on
    // fast-fail and OperationFailedError when op reported failure.
    template <typename Fn>
    auto execute(Fn&& op) -> typename std::invoke_result_t<Fn&>::value_type {
        auto result = call(std::forward<Fn>(op));
        switch (result.status()) {
            case CallStatus::Ok:
                return std::move(result.value());
            case CallStatus::CircuitOpen:
                throw CircuitOpenError(config_.name, result.error());
            case CallStatus::Failed:
            default:
                throw OperationFailedError(result.error());
        }
    }

    CircuitState state() const;
    CircuitBreakerStats stats() const;
    const CircuitBreakerConfig& config() const { return config_; }
    const std::string& name() const { return config_.name; }

    // Administrative reset: CLOSED with every counter at zero.
    void reset();

private:
    struct Permit {
        uint64_t generation;
        bool trial;
    };

    std::optional<Permit> tryAcquire(std::string& rejection);
    void onSuccess(const Permit& permit);
    void onFailure(const Permit& permit, const std::string& error);

    // Caller holds mutex_.
    void transitionLocked(CircuitState to);
    void announce(CircuitState from, CircuitState to, const std::string& cause);

    CircuitBreakerConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IAlertSink> alert_sink_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    // Bumped on every transition; outcomes from an older episode are not applied.
    uint64_t generation_ = 0;
    int consecutive_failures_ = 0;
    int half_open_in_flight_ = 0;
    std::optional<std::chrono::steady_clock::time_point> opened_at_;
    std::optional<std::chrono::system_clock::time_point> opened_at_wall_;
    std::chrono::system_clock::time_point last_state_change_;

    uint64_t total_calls_ = 0;
    uint64_t total_successes_ = 0;
    uint64_t total_failures_ = 0;
    uint64_t total_rejected_ = 0;
};

#endif // CIRCUITBREAKER_HPP
