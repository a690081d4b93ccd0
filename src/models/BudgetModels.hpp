#ifndef BUDGETMODELS_HPP
#define BUDGETMODELS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct AccountKey {
    std::string tenant_id;
    std::string project_id;

    bool operator<(const AccountKey& other) const {
        if (tenant_id != other.tenant_id) {
            return tenant_id < other.tenant_id;
        }
        return project_id < other.project_id;
    }
    bool operator==(const AccountKey& other) const {
        return tenant_id == other.tenant_id && project_id == other.project_id;
    }

    std::string to_string() const {
        return tenant_id + "/" + project_id;
    }
};

// Invariant: used + reserved <= total_limit.
struct BudgetAccount {
    AccountKey key;
    int64_t total_limit = 0;
    int64_t used = 0;
    int64_t reserved = 0;

    int64_t available() const {
        return total_limit - used - reserved;
    }
};

enum class TransactionType {
    RESERVE,
    COMMIT,
    RELEASE,
    REJECT
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::RESERVE: return "reserve";
        case TransactionType::COMMIT: return "commit";
        case TransactionType::RELEASE: return "release";
        case TransactionType::REJECT: return "reject";
    }
    return "unknown";
}

struct BudgetTransaction {
    uint64_t sequence = 0;
    AccountKey account_key;
    std::string request_id;
    std::string reservation_id;
    std::string task_id;
    TransactionType type = TransactionType::RESERVE;
    int64_t amount = 0;
    std::string purpose;
    std::string model;
    std::chrono::system_clock::time_point timestamp;
};

enum class ReservationState {
    ACTIVE,
    COMMITTED,
    RELEASED
};

struct Reservation {
    std::string reservation_id;
    std::string request_id;
    std::string task_id;
    AccountKey key;
    int64_t amount = 0;
    int64_t charged = 0;
    int64_t unbilled = 0;
    ReservationState state = ReservationState::ACTIVE;
    std::chrono::system_clock::time_point created_at;
};

struct TokenRequest {
    std::string tenant_id;
    std::string project_id;
    std::string task_id;
    std::string model;
    int64_t estimated_tokens = 0;
    std::string request_id;
    std::string purpose;

    AccountKey accountKey() const {
        return AccountKey{tenant_id, project_id};
    }
};

// Result of an atomic ledger reservation attempt.
struct ReserveOutcome {
    bool approved = false;
    std::string reservation_id;
    int64_t allocated = 0;
    int64_t available = 0;
    bool replayed = false;
    std::chrono::system_clock::time_point timestamp;
};

struct BudgetDecision {
    bool approved = false;
    std::optional<std::string> reservation_id;
    int64_t allocated = 0;
    std::optional<std::string> reason;
    std::string request_id;
    std::string timestamp;

    static constexpr auto INSUFFICIENT_FUNDS = "insufficient_funds";
    static constexpr auto DUPLICATE_IN_PROGRESS = "duplicate_request_in_progress";

    bool operator==(const BudgetDecision& other) const {
        return approved == other.approved
            && reservation_id == other.reservation_id
            && allocated == other.allocated
            && reason == other.reason
            && request_id == other.request_id
            && timestamp == other.timestamp;
    }
};

inline void to_json(json& j, const BudgetDecision& decision) {
    j = json{
        {"approved", decision.approved},
        {"allocated", decision.allocated},
        {"request_id", decision.request_id},
        {"timestamp", decision.timestamp}
    };
    j["reservation_id"] = decision.reservation_id ? json(*decision.reservation_id) : json(nullptr);
    j["reason"] = decision.reason ? json(*decision.reason) : json(nullptr);
}

inline void from_json(const json& j, BudgetDecision& decision) {
    decision.approved = j.at("approved").get<bool>();
    decision.allocated = j.at("allocated").get<int64_t>();
    decision.request_id = j.value("request_id", "");
    decision.timestamp = j.value("timestamp", "");
    if (j.contains("reservation_id") && j["reservation_id"].is_string()) {
        decision.reservation_id = j["reservation_id"].get<std::string>();
    } else {
        decision.reservation_id.reset();
    }
    if (j.contains("reason") && j["reason"].is_string()) {
        decision.reason = j["reason"].get<std::string>();
    } else {
        decision.reason.reset();
    }
}

enum class CommitStatus {
    COMMITTED,
    ALREADY_COMMITTED
};

struct CommitResult {
    CommitStatus status = CommitStatus::COMMITTED;
    std::string reservation_id;
    int64_t charged = 0;
    int64_t released = 0;
    int64_t unbilled = 0;
};

enum class ReleaseStatus {
    RELEASED,
    ALREADY_RELEASED
};

struct ReleaseResult {
    ReleaseStatus status = ReleaseStatus::RELEASED;
    std::string reservation_id;
    int64_t released = 0;
};

struct BudgetState {
    int64_t total = 0;
    int64_t used = 0;
    int64_t reserved = 0;
    int64_t available = 0;
};

#endif // BUDGETMODELS_HPP
