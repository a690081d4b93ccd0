#ifndef IBUDGETLEDGER_HPP
#define IBUDGETLEDGER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../models/BudgetModels.hpp"

// Durable store behind the budget controller. Every mutating call is a single
// atomic step against one account row; on StorageError nothing was applied.
class IBudgetLedger {
public:
    virtual ~IBudgetLedger() = default;

    // Conditional reserve. Repeating a request_id returns the first outcome.
    virtual ReserveOutcome reserve(const TokenRequest& request, int64_t default_limit) = 0;
    virtual std::optional<ReserveOutcome> findOutcome(const std::string& request_id) = 0;

    virtual CommitResult commit(const std::string& reservation_id, int64_t actual_tokens) = 0;
    virtual ReleaseResult release(const std::string& reservation_id) = 0;

    virtual std::optional<BudgetAccount> account(const AccountKey& key) = 0;
    virtual std::vector<BudgetTransaction> transactions(const AccountKey& key) = 0;
    virtual std::optional<Reservation> reservation(const std::string& reservation_id) = 0;
    virtual std::vector<Reservation> activeReservationsOlderThan(std::chrono::system_clock::time_point cutoff) = 0;

    virtual void setLimit(const AccountKey& key, int64_t total_limit) = 0;
};

#endif // IBUDGETLEDGER_HPP
