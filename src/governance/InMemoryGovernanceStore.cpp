#include "InMemoryGovernanceStore.hpp"

#include "../core/Errors.hpp"

InMemoryGovernanceStore::InMemoryGovernanceStore(const std::map<std::string, GovernanceRule>& seed_rules) {
    for (const auto& [role, rule] : seed_rules) {
        auto slot = std::make_shared<Slot>();
        slot->row.rule = rule;
        slot->row.rule.role = role;
        slots_.emplace(role, std::move(slot));
    }
}

std::shared_ptr<InMemoryGovernanceStore::Slot> InMemoryGovernanceStore::find(const std::string& role) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = slots_.find(role);
    return it == slots_.end() ? nullptr : it->second;
}

bool InMemoryGovernanceStore::withRule(const std::string& role, const RowFn& fn) {
    auto slot = find(role);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    fn(slot->row);
    return true;
}

void InMemoryGovernanceStore::withRuleOrCreate(const std::string& role, const GovernanceRule& defaults, const RowFn& fn) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto& entry = slots_[role];
        if (!entry) {
            entry = std::make_shared<Slot>();
            entry->row.rule = defaults;
            entry->row.rule.role = role;
        }
        slot = entry;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    fn(slot->row);
}

void InMemoryGovernanceStore::upsertRule(const GovernanceRule& rule) {
    if (rule.role.empty()) {
        throw ValidationError("Governance rule needs a role");
    }
    withRuleOrCreate(rule.role, rule, [&rule](GovernanceRow& row) {
        auto last_update_at = row.rule.last_update_at;
        row.rule = rule;
        row.rule.last_update_at = last_update_at;
    });
}

std::optional<GovernanceRule> InMemoryGovernanceStore::rule(const std::string& role) {
    std::optional<GovernanceRule> result;
    withRule(role, [&result](GovernanceRow& row) { result = row.rule; });
    return result;
}

std::vector<std::string> InMemoryGovernanceStore::roles() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    std::vector<std::string> result;
    result.reserve(slots_.size());
    for (const auto& entry : slots_) {
        result.push_back(entry.first);
    }
    return result;
}

void InMemoryGovernanceStore::insertApproval(const ApprovalRequest& request) {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    if (!approvals_.emplace(request.id, request).second) {
        throw ValidationError("Approval request " + request.id + " already exists");
    }
    approval_order_.push_back(request.id);
}

bool InMemoryGovernanceStore::withApproval(const std::string& id, const ApprovalFn& fn) {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    auto it = approvals_.find(id);
    if (it == approvals_.end()) {
        return false;
    }
    fn(it->second);
    return true;
}

std::vector<ApprovalRequest> InMemoryGovernanceStore::approvals(std::optional<ApprovalStatus> status) {
    std::lock_guard<std::mutex> lock(approvals_mutex_);
    std::vector<ApprovalRequest> result;
    for (const auto& id : approval_order_) {
        const ApprovalRequest& request = approvals_.at(id);
        if (!status || request.status == *status) {
            result.push_back(request);
        }
    }
    return result;
}
