#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<long long> stringToLongLong(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Accepts 1/0 and true/false
    static optional<bool> stringToBool(const std::string& str) {
        if (str == "1" || str == "true") return true;
        if (str == "0" || str == "false") return false;
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    static vector<string> split(const std::string& str, char delimiter) {
        vector<string> parts;
        std::stringstream ss(str);
        string item;
        while (getline(ss, item, delimiter)) {
            item = trim(item);
            if (!item.empty()) {
                parts.push_back(item);
            }
        }
        return parts;
    }

    // RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T10:00:00.123Z
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        if (millis < 0) {
            millis += 1000;
        }
        std::time_t tt = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_utc{};
        gmtime_r(&tt, &tm_utc);

        std::ostringstream oss;
        oss << std::put_time(&tm_utc, Constants::TIME_FORMAT)
            << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return oss.str();
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // governance.<role>=<max_per_day>,<cooldown_hours>,<requires_approval>
    static optional<GovernanceRule> parseGovernanceRule(const std::string& role, const std::string& value) {
        vector<string> parts = split(value, ',');
        if (role.empty() || parts.size() != 3) {
            return nullopt;
        }
        auto max_per_day = stringToInt(parts[0]);
        auto cooldown_hours = stringToInt(parts[1]);
        auto approval = stringToBool(parts[2]);
        if (!max_per_day || !cooldown_hours || !approval || *max_per_day < 0 || *cooldown_hours < 0) {
            return nullopt;
        }
        return GovernanceRule::make(role, *max_per_day, *cooldown_hours, *approval);
    }

    // Applies one key=value pair. Returns false for unknown keys and bad values,
    // leaving the config untouched.
    static bool applyConfigValue(AppConfig& config, const std::string& key, const std::string& value) {
        auto setPositiveInt = [&](int& field) {
            if (auto val = stringToInt(value)) {
                if (*val > 0) {
                    field = *val;
                    return true;
                }
            }
            cerr << "Warning: Invalid positive integer for " << key << ": " << value << endl;
            return false;
        };

        if (key == "use_redis") {
            if (auto val = stringToBool(value)) {
                config.use_redis = *val;
                return true;
            }
            cerr << "Warning: Invalid boolean for use_redis: " << value << endl;
            return false;
        } else if (key == "redis_host") {
            config.redis_host = value;
            return true;
        } else if (key == "redis_port") {
            if (auto val = stringToInt(value)) {
                if (*val > 0 && *val <= 65535) {
                    config.redis_port = *val;
                    return true;
                }
            }
            cerr << "Warning: Invalid port for redis_port: " << value << endl;
            return false;
        } else if (key == "in_memory_cache_max_size") {
            return setPositiveInt(config.in_memory_cache_max_size);
        } else if (key == "idempotency_ttl_seconds") {
            return setPositiveInt(config.idempotency_ttl_seconds);
        } else if (key == "idempotency_wait_millis") {
            return setPositiveInt(config.idempotency_wait_millis);
        } else if (key == "default_token_limit") {
            if (auto val = stringToLongLong(value)) {
                if (*val >= 0) {
                    config.default_token_limit = *val;
                    return true;
                }
            }
            cerr << "Warning: Invalid token limit for default_token_limit: " << value << endl;
            return false;
        } else if (key == "reservation_max_age_seconds") {
            return setPositiveInt(config.reservation_max_age_seconds);
        } else if (key == "reservation_sweep_interval_seconds") {
            return setPositiveInt(config.reservation_sweep_interval_seconds);
        } else if (key == "breaker_failure_threshold") {
            return setPositiveInt(config.breaker_failure_threshold);
        } else if (key == "breaker_recovery_timeout_millis") {
            return setPositiveInt(config.breaker_recovery_timeout_millis);
        } else if (key == "breaker_half_open_max_calls") {
            return setPositiveInt(config.breaker_half_open_max_calls);
        } else if (key == "critical_dependencies") {
            vector<string> names = split(value, ',');
            config.critical_dependencies = std::set<std::string>(names.begin(), names.end());
            return true;
        } else if (key == "dlq_max_attempts") {
            return setPositiveInt(config.dlq_max_attempts);
        } else if (key == "retry_base_delay_millis") {
            return setPositiveInt(config.retry_base_delay_millis);
        } else if (key == "retry_max_delay_millis") {
            return setPositiveInt(config.retry_max_delay_millis);
        } else if (key == "worker_threads") {
            return setPositiveInt(config.worker_threads);
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
                return false;
            }
        } else if (key == "metrics_batch_size") {
            return setPositiveInt(config.metrics_batch_size);
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            return setPositiveInt(config.metrics_send_interval_in_millis);
        } else if (key == "stats_report_interval_seconds") {
            return setPositiveInt(config.stats_report_interval_seconds);
        } else if (key.rfind(Constants::GOVERNANCE_KEY_PREFIX, 0) == 0) {
            string role = key.substr(std::string(Constants::GOVERNANCE_KEY_PREFIX).size());
            if (auto rule = parseGovernanceRule(role, value)) {
                config.governance_rules[role] = *rule;
                return true;
            }
            cerr << "Warning: Invalid governance rule for " << key << ": '" << value
                 << "'. Expected <max_per_day>,<cooldown_hours>,<requires_approval>." << endl;
            return false;
        }

        cerr << "Warning: Unknown configuration key: " << key << endl;
        return false;
    }

    // Config file first, then command-line arguments on top of it.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments) {
        AppConfig config;

        // --- Load from Config File ---
        // Try multiple config file locations
        std::vector<std::string> config_paths = {
            std::string(Constants::CONFIG_FILE_NAME),            // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,    // Parent directory
            std::string("/app/") + Constants::CONFIG_FILE_NAME,  // Docker container path
            std::string("../../") + Constants::CONFIG_FILE_NAME  // Development path
        };

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                std::string line;
                while (getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != string::npos && delimiterPos > 0) {
                        applyConfigValue(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                    } else {
                        cerr << "Warning: Ignoring malformed config line: " << line << endl;
                    }
                }
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        for (const auto& pair : startupArguments) {
            applyConfigValue(config, trim(pair.first), trim(pair.second));
        }

        return config;
    }
};

#endif // UTILS_HPP
