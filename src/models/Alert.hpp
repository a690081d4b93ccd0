#pragma once

#include <string>

#include <nlohmann/json.hpp>

enum class AlertSeverity {
    WARNING,
    CRITICAL
};

struct Alert {
    AlertSeverity severity = AlertSeverity::CRITICAL;
    std::string source;
    std::string summary;
    nlohmann::json details = nlohmann::json::object();
};

inline std::string toString(AlertSeverity severity) {
    return severity == AlertSeverity::CRITICAL ? "critical" : "warning";
}
