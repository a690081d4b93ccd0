#ifndef INMEMORYBUDGETLEDGER_HPP
#define INMEMORYBUDGETLEDGER_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../interfaces/IBudgetLedger.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"

// Ledger with the locking discipline of a row-locked relational store: every
// mutation of an account (balance, reservations, transaction log, request
// outcomes) happens while holding that account's row mutex. index_mutex_ only
// guards the lookup maps and is never held while waiting on a row.
class InMemoryBudgetLedger : public IBudgetLedger {
public:
    InMemoryBudgetLedger(std::shared_ptr<ILogger> logger, std::shared_ptr<IClock> clock);
    ~InMemoryBudgetLedger() override = default;

    ReserveOutcome reserve(const TokenRequest& request, int64_t default_limit) override;
    std::optional<ReserveOutcome> findOutcome(const std::string& request_id) override;

    CommitResult commit(const std::string& reservation_id, int64_t actual_tokens) override;
    ReleaseResult release(const std::string& reservation_id) override;

    std::optional<BudgetAccount> account(const AccountKey& key) override;
    std::vector<BudgetTransaction> transactions(const AccountKey& key) override;
    std::optional<Reservation> reservation(const std::string& reservation_id) override;
    std::vector<Reservation> activeReservationsOlderThan(std::chrono::system_clock::time_point cutoff) override;

    void setLimit(const AccountKey& key, int64_t total_limit) override;

private:
    struct RequestRecord {
        TokenRequest request;
        ReserveOutcome outcome;
    };

    struct AccountRow {
        std::mutex mutex;
        BudgetAccount account;
        std::vector<BudgetTransaction> transactions;
        std::unordered_map<std::string, Reservation> reservations;
        std::unordered_map<std::string, RequestRecord> requests;
    };

    std::shared_ptr<AccountRow> findRow(const AccountKey& key) const;
    std::shared_ptr<AccountRow> findOrCreateRow(const AccountKey& key, int64_t default_limit);
    std::shared_ptr<AccountRow> rowForReservation(const std::string& reservation_id) const;

    // Binds request_id to key in request_index_. Returns true when this call
    // made the binding; throws ValidationError if it belongs to another account.
    bool claimRequest(const std::string& request_id, const AccountKey& key);
    void unclaimRequest(AccountRow& row, const std::string& request_id);
    ReserveOutcome reserveLocked(AccountRow& row, const TokenRequest& request);

    // Caller holds row.mutex. Stamps sequence and timestamp.
    void appendLocked(AccountRow& row, BudgetTransaction tx);

    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex index_mutex_;
    std::map<AccountKey, std::shared_ptr<AccountRow>> rows_;
    std::unordered_map<std::string, AccountKey> request_index_;
    std::unordered_map<std::string, AccountKey> reservation_index_;

    std::atomic<uint64_t> next_sequence_{1};
};

#endif // INMEMORYBUDGETLEDGER_HPP
