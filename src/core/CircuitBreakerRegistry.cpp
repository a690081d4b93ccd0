#include "CircuitBreakerRegistry.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig default_config,
                                               std::set<std::string> critical_dependencies,
                                               std::shared_ptr<ILogger> logger,
                                               std::shared_ptr<IStatsDClient> statsd_client,
                                               std::shared_ptr<IClock> clock,
                                               std::shared_ptr<IAlertSink> alert_sink)
    : default_config_(std::move(default_config)),
      critical_dependencies_(std::move(critical_dependencies)),
      logger_(logger),
      statsd_client_(statsd_client),
      clock_(clock),
      alert_sink_(alert_sink) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreakerRegistry");
    }
}

void CircuitBreakerRegistry::registerBreaker(const std::string& name, std::shared_ptr<CircuitBreaker> breaker) {
    if (name.empty()) {
        throw std::invalid_argument("Circuit breaker name cannot be empty");
    }
    if (!breaker) {
        throw std::invalid_argument("Cannot register a null circuit breaker under " + name);
    }
    bool replaced;
    {
        std::unique_lock<std::shared_mutex> lock(breakers_mutex_);
        replaced = breakers_.count(name) > 0;
        breakers_[name] = std::move(breaker);
    }
    logger_->info(std::string(replaced ? "Replaced" : "Registered") + " circuit breaker: " + name);
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    auto it = breakers_.find(name);
    return it == breakers_.end() ? nullptr : it->second;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getOrCreate(const std::string& name) {
    if (auto existing = get(name)) {
        return existing;
    }

    CircuitBreakerConfig config = default_config_;
    config.name = name;
    config.critical = critical_dependencies_.count(name) > 0;

    std::unique_lock<std::shared_mutex> lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(name, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(config, logger_, statsd_client_, clock_, alert_sink_);
        logger_->info("Created circuit breaker: " + name + (config.critical ? " (critical)" : ""));
    }
    return it->second;
}

std::map<std::string, CircuitBreakerStats> CircuitBreakerRegistry::allStats() const {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    std::map<std::string, CircuitBreakerStats> result;
    for (const auto& [name, breaker] : breakers_) {
        result.emplace(name, breaker->stats());
    }
    return result;
}

size_t CircuitBreakerRegistry::resetAll() {
    std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
        snapshot.reserve(breakers_.size());
        for (const auto& entry : breakers_) {
            snapshot.push_back(entry.second);
        }
    }
    for (const auto& breaker : snapshot) {
        breaker->reset();
    }
    logger_->warn("All circuit breakers reset (" + std::to_string(snapshot.size()) + ")");
    return snapshot.size();
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    return breakers_.size();
}
