#ifndef INMEMORYGOVERNANCESTORE_HPP
#define INMEMORYGOVERNANCESTORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../interfaces/IGovernanceStore.hpp"

// One mutex per role row, one for the approval table. Row callbacks run while
// the row is locked and must not call back into the store for the same role.
class InMemoryGovernanceStore : public IGovernanceStore {
public:
    explicit InMemoryGovernanceStore(const std::map<std::string, GovernanceRule>& seed_rules = {});
    ~InMemoryGovernanceStore() override = default;

    bool withRule(const std::string& role, const RowFn& fn) override;
    void withRuleOrCreate(const std::string& role, const GovernanceRule& defaults, const RowFn& fn) override;

    void upsertRule(const GovernanceRule& rule) override;
    std::optional<GovernanceRule> rule(const std::string& role) override;
    std::vector<std::string> roles() override;

    void insertApproval(const ApprovalRequest& request) override;
    bool withApproval(const std::string& id, const ApprovalFn& fn) override;
    std::vector<ApprovalRequest> approvals(std::optional<ApprovalStatus> status) override;

private:
    struct Slot {
        std::mutex mutex;
        GovernanceRow row;
    };

    std::shared_ptr<Slot> find(const std::string& role);

    std::mutex index_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    std::mutex approvals_mutex_;
    std::map<std::string, ApprovalRequest> approvals_;
    std::vector<std::string> approval_order_;
};

#endif // INMEMORYGOVERNANCESTORE_HPP
