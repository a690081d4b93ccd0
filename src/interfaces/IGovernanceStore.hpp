#ifndef IGOVERNANCESTORE_HPP
#define IGOVERNANCESTORE_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../models/GovernanceRule.hpp"

struct GovernanceRow {
    GovernanceRule rule;
    std::deque<std::pair<std::chrono::system_clock::time_point, UpdateKind>> updates;
};

class IGovernanceStore {
public:
    using RowFn = std::function<void(GovernanceRow&)>;
    using ApprovalFn = std::function<void(ApprovalRequest&)>;

    virtual ~IGovernanceStore() = default;

    // Runs fn under the role's row lock. Returns false if the role has no rule.
    virtual bool withRule(const std::string& role, const RowFn& fn) = 0;
    // Same, inserting `defaults` first when the role has no rule.
    virtual void withRuleOrCreate(const std::string& role, const GovernanceRule& defaults, const RowFn& fn) = 0;

    // Administrative edit; keeps last_update_at and the update history.
    virtual void upsertRule(const GovernanceRule& rule) = 0;
    virtual std::optional<GovernanceRule> rule(const std::string& role) = 0;
    virtual std::vector<std::string> roles() = 0;

    virtual void insertApproval(const ApprovalRequest& request) = 0;
    virtual bool withApproval(const std::string& id, const ApprovalFn& fn) = 0;
    virtual std::vector<ApprovalRequest> approvals(std::optional<ApprovalStatus> status) = 0;
};

#endif // IGOVERNANCESTORE_HPP
