#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <map>
#include <set>
#include <string>
#include <sstream>

#include "../models/GovernanceRule.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "steward.exception";

    static std::string BREAKER_OPENED = "steward.breaker.opened";
    static std::string BREAKER_REJECTED = "steward.breaker.rejected";
    static std::string BREAKER_RESET = "steward.breaker.reset";
    static std::string BREAKERS_OPEN = "steward.breaker.open_count";

    static std::string BUDGET_APPROVED = "steward.budget.approved";
    static std::string BUDGET_DECLINED = "steward.budget.declined";
    static std::string BUDGET_DUPLICATE = "steward.budget.duplicate";
    static std::string BUDGET_COMMITTED = "steward.budget.committed";
    static std::string BUDGET_RELEASED = "steward.budget.released";
    static std::string BUDGET_SWEPT = "steward.budget.swept";

    static std::string DLQ_RETRY_SCHEDULED = "steward.dlq.retry_scheduled";
    static std::string DLQ_EXHAUSTED = "steward.dlq.exhausted";
    static std::string DLQ_RESOLVED = "steward.dlq.resolved";
    static std::string DLQ_REQUEUED = "steward.dlq.requeued";

    static std::string GOVERNANCE_ALLOWED = "steward.governance.allowed";
    static std::string GOVERNANCE_DENIED = "steward.governance.denied";
    static std::string GOVERNANCE_APPROVED = "steward.governance.approved";
    static std::string GOVERNANCE_REJECTED = "steward.governance.rejected";

    static std::string ALERT_RAISED = "steward.alert.raised";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto CONFIG_FILE_NAME = "steward.config";
    static constexpr auto GOVERNANCE_KEY_PREFIX = "governance.";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int in_memory_cache_max_size;

    // Idempotency
    int idempotency_ttl_seconds;
    int idempotency_wait_millis;

    // Budget
    long long default_token_limit;
    int reservation_max_age_seconds;
    int reservation_sweep_interval_seconds;

    // Circuit breakers
    int breaker_failure_threshold;
    int breaker_recovery_timeout_millis;
    int breaker_half_open_max_calls;
    std::set<std::string> critical_dependencies;

    // Dead letters and retries
    int dlq_max_attempts;
    int retry_base_delay_millis;
    int retry_max_delay_millis;
    int worker_threads;

    // Governance rules keyed by role
    std::map<std::string, GovernanceRule> governance_rules;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;
    int stats_report_interval_seconds;

    AppConfig() {
        use_redis = true;
        redis_host = "localhost";
        redis_port = 6379;
        in_memory_cache_max_size = 100000;

        idempotency_ttl_seconds = 300; // 5 minutes
        idempotency_wait_millis = 2000;

        default_token_limit = 1000000;
        reservation_max_age_seconds = 3600;
        reservation_sweep_interval_seconds = 60;

        breaker_failure_threshold = 5;
        breaker_recovery_timeout_millis = 30000;
        breaker_half_open_max_calls = 1;

        dlq_max_attempts = 5;
        retry_base_delay_millis = 500;
        retry_max_delay_millis = 60000;
        worker_threads = 4;

        log_level = LogUtils::LogLevel::CERROR;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;
        stats_report_interval_seconds = 30;

        governance_rules = GovernanceRule::defaultRules();
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "in_memory_cache_max_size: " << in_memory_cache_max_size << std::endl
            << "idempotency_ttl_seconds: " << idempotency_ttl_seconds << std::endl
            << "idempotency_wait_millis: " << idempotency_wait_millis << std::endl
            << "// --- Budget --- //" << std::endl
            << "default_token_limit: " << default_token_limit << std::endl
            << "reservation_max_age_seconds: " << reservation_max_age_seconds << std::endl
            << "reservation_sweep_interval_seconds: " << reservation_sweep_interval_seconds << std::endl
            << "// --- Circuit Breakers --- //" << std::endl
            << "breaker_failure_threshold: " << breaker_failure_threshold << std::endl
            << "breaker_recovery_timeout_millis: " << breaker_recovery_timeout_millis << std::endl
            << "breaker_half_open_max_calls: " << breaker_half_open_max_calls << std::endl
            << "critical_dependencies:";
        for (const auto& name : critical_dependencies) {
            ss << " " << name;
        }
        ss << std::endl
            << "// --- Dead Letters --- //" << std::endl
            << "dlq_max_attempts: " << dlq_max_attempts << std::endl
            << "retry_base_delay_millis: " << retry_base_delay_millis << std::endl
            << "retry_max_delay_millis: " << retry_max_delay_millis << std::endl
            << "worker_threads: " << worker_threads << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "stats_report_interval_seconds: " << stats_report_interval_seconds << std::endl;

        ss << "--- Governance rules (role : max/day, cooldown hours, approval) ---" << std::endl;
        for (const auto& [role, rule] : governance_rules) {
            ss << role << " : " << rule.max_updates_per_day << ", "
               << std::chrono::duration_cast<std::chrono::hours>(rule.cooldown).count() << ", "
               << std::boolalpha << rule.requires_human_approval << std::noboolalpha << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
