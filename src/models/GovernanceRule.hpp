#ifndef GOVERNANCERULE_HPP
#define GOVERNANCERULE_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>

enum class UpdateKind {
    AUTO,
    APPROVED
};

// Learning limits for one agent role.
struct GovernanceRule {
    std::string role;
    int max_updates_per_day = 5;
    std::chrono::seconds cooldown = std::chrono::hours(2);
    bool requires_human_approval = false;
    std::optional<std::chrono::system_clock::time_point> last_update_at;

    static GovernanceRule make(const std::string& role, int max_per_day, int cooldown_hours, bool approval) {
        GovernanceRule rule;
        rule.role = role;
        rule.max_updates_per_day = max_per_day;
        rule.cooldown = std::chrono::hours(cooldown_hours);
        rule.requires_human_approval = approval;
        return rule;
    }

    // Deployment seed. Config entries override these per role.
    static std::map<std::string, GovernanceRule> defaultRules() {
        std::map<std::string, GovernanceRule> rules;
        rules["security"] = make("security", 1, 24, true);
        rules["developer"] = make("developer", 5, 2, false);
        rules["reviewer"] = make("reviewer", 3, 4, false);
        rules["tester"] = make("tester", 5, 2, false);
        rules["architect"] = make("architect", 2, 12, true);
        return rules;
    }
};

struct GovernanceDecision {
    bool allowed = false;
    std::string reason;

    static constexpr auto ALLOWED = "allowed";
    static constexpr auto REQUIRES_APPROVAL = "requires_approval";
    static constexpr auto COOLDOWN_ACTIVE = "cooldown_active";
    static constexpr auto DAILY_LIMIT_REACHED = "daily_limit_reached";
    static constexpr auto UNKNOWN_ROLE = "unknown_role";
};

enum class ApprovalStatus {
    PENDING_REVIEW,
    HUMAN_APPROVED,
    REJECTED
};

inline std::string toString(ApprovalStatus status) {
    switch (status) {
        case ApprovalStatus::PENDING_REVIEW: return "pending_review";
        case ApprovalStatus::HUMAN_APPROVED: return "human_approved";
        case ApprovalStatus::REJECTED: return "rejected";
    }
    return "unknown";
}

struct ApprovalRequest {
    std::string id;
    std::string role;
    std::string description;
    ApprovalStatus status = ApprovalStatus::PENDING_REVIEW;
    std::string decided_by;
    std::string note;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> decided_at;
};

struct GovernanceStatus {
    GovernanceRule rule;
    int auto_updates_last_24h = 0;
    int pending_count = 0;
    std::string status;
};

#endif // GOVERNANCERULE_HPP
