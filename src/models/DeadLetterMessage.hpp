#ifndef DEADLETTERMESSAGE_HPP
#define DEADLETTERMESSAGE_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// An asynchronous unit of work travelling towards a destination handler.
struct WorkItem {
    std::string id;
    std::string destination;
    json payload;
    int attempt_count = 0;
    int max_attempts = 0;
    std::string last_error;
    std::chrono::system_clock::time_point created_at;
};

// Parked work item. Never deleted; resolution only flips flags.
struct DeadLetterMessage {
    std::string id;
    std::string original_destination;
    json payload;
    std::string last_error;
    int attempt_count = 0;
    int max_attempts = 0;
    std::chrono::system_clock::time_point created_at;
    bool resolved = false;
    std::string resolution_note;
    bool requeued = false;
    std::optional<std::chrono::system_clock::time_point> resolved_at;
};

enum class ResolveStatus {
    RESOLVED,
    ALREADY_RESOLVED
};

struct ResolveResult {
    ResolveStatus status = ResolveStatus::RESOLVED;
    std::string message_id;
    bool requeued = false;
};

#endif // DEADLETTERMESSAGE_HPP
