#ifndef GOVERNANCELIMITER_HPP
#define GOVERNANCELIMITER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/IClock.hpp"
#include "../interfaces/IGovernanceStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/GovernanceRule.hpp"

// Rate limits on automatic self-modification, per agent role.
//
// An AUTO update is allowed when the role has a rule, the rule does not demand
// human approval, the cooldown since the last update has elapsed, and fewer
// than max_updates_per_day AUTO updates happened in the trailing 24 hours.
// Human-approved updates bypass the gate; they restart the cooldown but do not
// count against the daily cap.
class GovernanceLimiter {
public:
    GovernanceLimiter(std::shared_ptr<IGovernanceStore> store,
                      std::shared_ptr<IStatsDClient> statsd_client,
                      std::shared_ptr<ILogger> logger,
                      std::shared_ptr<IClock> clock);

    GovernanceLimiter(const GovernanceLimiter&) = delete;
    GovernanceLimiter& operator=(const GovernanceLimiter&) = delete;

    bool canAutoUpdate(const std::string& role);
    GovernanceDecision evaluate(const std::string& role);
    // Check and record in one step under the role's lock.
    GovernanceDecision tryAutoUpdate(const std::string& role);
    // Unknown roles are created with the default rule.
    void recordUpdate(const std::string& role, UpdateKind kind = UpdateKind::AUTO);

    std::string submitForApproval(const std::string& role, const std::string& description);
    ApprovalRequest approve(const std::string& id, const std::string& approver, const std::string& note = "");
    ApprovalRequest reject(const std::string& id, const std::string& approver, const std::string& reason);
    std::vector<ApprovalRequest> pendingApprovals();

    std::optional<GovernanceStatus> status(const std::string& role);
    std::vector<GovernanceStatus> allStatuses();
    void upsertRule(const GovernanceRule& rule);

    static constexpr auto CAN_AUTO_UPDATE = "can_auto_update";

private:
    // Caller holds the row lock.
    GovernanceDecision evaluateLocked(GovernanceRow& row, std::chrono::system_clock::time_point now) const;
    void recordLocked(GovernanceRow& row, UpdateKind kind, std::chrono::system_clock::time_point now) const;
    ApprovalRequest decide(const std::string& id, const std::string& approver, const std::string& note, ApprovalStatus outcome);
    void countDecision(const std::string& role, const GovernanceDecision& decision);

    std::shared_ptr<IGovernanceStore> store_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;
};

#endif // GOVERNANCELIMITER_HPP
