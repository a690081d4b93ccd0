#ifndef IDEMPOTENTBUDGETCONTROLLER_HPP
#define IDEMPOTENTBUDGETCONTROLLER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "../cache/IdempotencyStore.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/IBudgetLedger.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/BudgetModels.hpp"

// Token budget front door. A request_id maps to exactly one BudgetDecision no
// matter how often or how concurrently it is submitted: the cache short-cuts
// repeats, the ledger's own request index settles races the cache cannot see.
class IdempotentBudgetController {
public:
    IdempotentBudgetController(std::shared_ptr<IBudgetLedger> ledger,
                               std::shared_ptr<IdempotencyStore> idempotency,
                               std::shared_ptr<IStatsDClient> statsd_client,
                               const AppConfig& config,
                               std::shared_ptr<ILogger> logger,
                               std::shared_ptr<IClock> clock);

    IdempotentBudgetController(const IdempotentBudgetController&) = delete;
    IdempotentBudgetController& operator=(const IdempotentBudgetController&) = delete;

    // Throws ValidationError for malformed requests and StorageError when the
    // ledger failed; in the latter case nothing was reserved.
    BudgetDecision requestTokens(const TokenRequest& request);

    CommitResult commitUsage(const std::string& reservation_id, int64_t actual_tokens);
    ReleaseResult releaseReservation(const std::string& reservation_id);

    // Accounts that were never touched report the default limit.
    BudgetState budgetState(const std::string& tenant_id, const std::string& project_id);
    void setLimit(const std::string& tenant_id, const std::string& project_id, int64_t total_limit);

    // Releases ACTIVE reservations older than max_age. Returns how many were released.
    int sweepExpiredReservations(std::chrono::seconds max_age);

    static constexpr auto IDEMPOTENCY_SCOPE = "budget";

private:
    void validate(const TokenRequest& request) const;
    BudgetDecision toDecision(const ReserveOutcome& outcome, const std::string& request_id) const;
    std::optional<BudgetDecision> cachedDecision(const std::string& request_id);
    // Another caller holds the claim: wait for its decision, then fall back to the ledger.
    BudgetDecision awaitConcurrentDecision(const TokenRequest& request);
    void recordDecision(const BudgetDecision& decision, const TokenRequest& request);

    std::shared_ptr<IBudgetLedger> ledger_;
    std::shared_ptr<IdempotencyStore> idempotency_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;

    int64_t default_token_limit_;
    std::chrono::milliseconds duplicate_wait_;
    std::chrono::milliseconds duplicate_poll_interval_{25};
};

#endif // IDEMPOTENTBUDGETCONTROLLER_HPP
