#ifndef CIRCUITBREAKERREGISTRY_HPP
#define CIRCUITBREAKERREGISTRY_HPP

#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "CircuitBreaker.hpp"

// Catalogue of named breakers. Built once at startup and passed to whoever needs
// it; tests construct their own.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(CircuitBreakerConfig default_config,
                           std::set<std::string> critical_dependencies,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<IAlertSink> alert_sink);

    // Replaces any breaker already registered under the name.
    void registerBreaker(const std::string& name, std::shared_ptr<CircuitBreaker> breaker);
    std::shared_ptr<CircuitBreaker> get(const std::string& name) const;
    // Creates the breaker from the default config on first use.
    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& name);

    std::map<std::string, CircuitBreakerStats> allStats() const;
    // Administrative escape hatch. Returns the number of breakers reset.
    size_t resetAll();
    size_t size() const;

private:
    CircuitBreakerConfig default_config_;
    std::set<std::string> critical_dependencies_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IAlertSink> alert_sink_;

    mutable std::shared_mutex breakers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

#endif // CIRCUITBREAKERREGISTRY_HPP
