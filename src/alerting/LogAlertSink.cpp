#include "LogAlertSink.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp"

LogAlertSink::LogAlertSink(std::shared_ptr<ILogger> logger, std::shared_ptr<IStatsDClient> statsd_client)
    : logger_(logger), statsd_client_(statsd_client) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LogAlertSink");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for LogAlertSink");
    }
}

void LogAlertSink::raise(const Alert& alert) {
    nlohmann::json line = {
        {"alert", toString(alert.severity)},
        {"source", alert.source},
        {"summary", alert.summary},
        {"details", alert.details}
    };
    if (alert.severity == AlertSeverity::CRITICAL) {
        logger_->critical(line.dump());
    } else {
        logger_->error(line.dump());
    }
    statsd_client_->increment(MetricsDefinitions::ALERT_RAISED + "." + toString(alert.severity));
}
