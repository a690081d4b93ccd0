#include <csignal>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/executor_work_guard.hpp> // For make_work_guard
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp> // For graceful shutdown

#include "alerting/LogAlertSink.hpp"
#include "cache/InMemoryCache.hpp"
#include "cache/RedisCache.hpp"
#include "config/AppConfig.hpp"
#include "core/ControlPlane.hpp"
#include "core/SystemClock.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using namespace std;

// --- Helper Function to Initialize Cache ---
std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_cache = std::make_shared<RedisCache>(config_, logger_);
        if (redis_cache->isConnected()) {
            logger_->setup("Redis cache connected successfully.");
            return redis_cache;
        }
        logger_->error("Redis unreachable at " + config_.redis_host + ":" + std::to_string(config_.redis_port)
            + ". Idempotency keys will not be shared between instances.");
    }
    logger_->setup("Creating InMemoryCache.");
    return std::make_shared<InMemoryCache>(config_.idempotency_ttl_seconds, config_.in_memory_cache_max_size);
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }
    logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);

    try {
        if (!statsd_server_endpoint.empty()) {
            logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
            return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
        }
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to start: " + std::string(e.what()));
    }

    logger_->setup("Using DummyStatsDClient instance.");
    return DummyStatsDClient::getInstance();
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        logger_->setup("IStatsDClient instance created");

        std::shared_ptr<CacheInterface> cache_instance = initializeCache(config_, logger_);
        logger_->setup("CacheInterface created");

        auto clock = std::make_shared<SystemClock>();
        auto alert_sink = std::make_shared<LogAlertSink>(logger_, statsd_client);

        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc); // Keep ioc.run() from returning if no work

        auto control_plane = std::make_shared<ControlPlane>(
            ioc, config_, cache_instance, statsd_client, logger_, clock, alert_sink);
        control_plane->start();

        // Setup signal handling for graceful shutdown
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](const boost::system::error_code&, int signal_number) {
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                control_plane->shutdown();
                work_guard.reset();
                ioc.stop();
            });

        logger_->setup("Steward control plane running. Press Ctrl+C to exit.");
        ioc.run();

        control_plane->shutdown();
        logger_->setup("Shutdown complete. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    } catch (...) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unknown error occurred. Exiting.");
        return 1;
    }
}
