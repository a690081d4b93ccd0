#include "IdempotentBudgetController.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

#include "../core/Errors.hpp"
#include "../utils/Utils.hpp"

IdempotentBudgetController::IdempotentBudgetController(std::shared_ptr<IBudgetLedger> ledger,
                                                       std::shared_ptr<IdempotencyStore> idempotency,
                                                       std::shared_ptr<IStatsDClient> statsd_client,
                                                       const AppConfig& config,
                                                       std::shared_ptr<ILogger> logger,
                                                       std::shared_ptr<IClock> clock)
    : ledger_(ledger),
      idempotency_(idempotency),
      statsd_client_(statsd_client),
      logger_(logger),
      clock_(clock),
      default_token_limit_(config.default_token_limit),
      duplicate_wait_(config.idempotency_wait_millis) {
    if (!ledger_) {
        throw std::invalid_argument("Ledger cannot be null for IdempotentBudgetController");
    }
    if (!idempotency_) {
        throw std::invalid_argument("IdempotencyStore cannot be null for IdempotentBudgetController");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for IdempotentBudgetController");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for IdempotentBudgetController");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for IdempotentBudgetController");
    }
}

void IdempotentBudgetController::validate(const TokenRequest& request) const {
    const std::vector<std::pair<const char*, const std::string*>> required = {
        {"tenant_id", &request.tenant_id},
        {"project_id", &request.project_id},
        {"task_id", &request.task_id},
        {"model", &request.model},
        {"request_id", &request.request_id},
        {"purpose", &request.purpose}
    };
    for (const auto& [field, value] : required) {
        if (value->empty()) {
            throw ValidationError(std::string(field) + " must not be empty");
        }
    }
    if (request.estimated_tokens <= 0) {
        throw ValidationError("estimated_tokens must be positive, got " + std::to_string(request.estimated_tokens));
    }
}

BudgetDecision IdempotentBudgetController::toDecision(const ReserveOutcome& outcome, const std::string& request_id) const {
    BudgetDecision decision;
    decision.approved = outcome.approved;
    decision.request_id = request_id;
    decision.timestamp = Utils::formatTimestamp(outcome.timestamp);
    if (outcome.approved) {
        decision.reservation_id = outcome.reservation_id;
        decision.allocated = outcome.allocated;
    } else {
        decision.allocated = 0;
        decision.reason = BudgetDecision::INSUFFICIENT_FUNDS;
    }
    return decision;
}

std::optional<BudgetDecision> IdempotentBudgetController::cachedDecision(const std::string& request_id) {
    auto cached = idempotency_->lookup(IDEMPOTENCY_SCOPE, request_id);
    if (!cached) {
        return std::nullopt;
    }
    try {
        return cached->get<BudgetDecision>();
    } catch (const nlohmann::json::exception& e) {
        logger_->error("Cached budget decision for " + request_id + " is malformed: " + e.what());
        return std::nullopt;
    }
}

BudgetDecision IdempotentBudgetController::awaitConcurrentDecision(const TokenRequest& request) {
    const long long polls = duplicate_wait_ / duplicate_poll_interval_;
    for (long long i = 0; i < polls; ++i) {
        std::this_thread::sleep_for(duplicate_poll_interval_);
        if (auto decision = cachedDecision(request.request_id)) {
            statsd_client_->increment(MetricsDefinitions::BUDGET_DUPLICATE);
            return *decision;
        }
    }

    if (auto outcome = ledger_->findOutcome(request.request_id)) {
        BudgetDecision decision = toDecision(*outcome, request.request_id);
        idempotency_->store(IDEMPOTENCY_SCOPE, request.request_id, decision);
        statsd_client_->increment(MetricsDefinitions::BUDGET_DUPLICATE);
        return decision;
    }

    logger_->warn("Budget request " + request.request_id + " still in progress elsewhere after "
        + std::to_string(duplicate_wait_.count()) + "ms; declining duplicate");
    statsd_client_->increment(MetricsDefinitions::BUDGET_DUPLICATE);

    BudgetDecision decision;
    decision.approved = false;
    decision.allocated = 0;
    decision.reason = BudgetDecision::DUPLICATE_IN_PROGRESS;
    decision.request_id = request.request_id;
    decision.timestamp = Utils::formatTimestamp(clock_->systemNow());
    return decision;
}

void IdempotentBudgetController::recordDecision(const BudgetDecision& decision, const TokenRequest& request) {
    const std::string account = request.accountKey().to_string();
    if (decision.approved) {
        statsd_client_->increment(MetricsDefinitions::BUDGET_APPROVED);
        logger_->info("Budget approved: " + account + " - " + std::to_string(decision.allocated)
            + " tokens for task " + request.task_id + " (request " + request.request_id + ")");
    } else {
        statsd_client_->increment(MetricsDefinitions::BUDGET_DECLINED);
        logger_->warn("Budget declined: " + account + " - " + std::to_string(request.estimated_tokens)
            + " tokens for task " + request.task_id + " (" + decision.reason.value_or("") + ")");
    }
}

BudgetDecision IdempotentBudgetController::requestTokens(const TokenRequest& request) {
    validate(request);

    if (auto cached = cachedDecision(request.request_id)) {
        logger_->debug("Returning cached budget decision for " + request.request_id);
        statsd_client_->increment(MetricsDefinitions::BUDGET_DUPLICATE);
        return *cached;
    }

    CacheInsertResult claim = idempotency_->claim(IDEMPOTENCY_SCOPE, request.request_id);
    if (claim == CacheInsertResult::AlreadyExists) {
        return awaitConcurrentDecision(request);
    }
    // Unavailable: carry on, the ledger de-duplicates by request_id on its own.

    ReserveOutcome outcome;
    try {
        outcome = ledger_->reserve(request, default_token_limit_);
    } catch (const StorageError& e) {
        logger_->error("Budget ledger failure for request " + request.request_id + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        if (claim == CacheInsertResult::Inserted) {
            idempotency_->abandon(IDEMPOTENCY_SCOPE, request.request_id);
        }
        throw;
    } catch (const ValidationError&) {
        if (claim == CacheInsertResult::Inserted) {
            idempotency_->abandon(IDEMPOTENCY_SCOPE, request.request_id);
        }
        throw;
    }

    BudgetDecision decision = toDecision(outcome, request.request_id);
    idempotency_->store(IDEMPOTENCY_SCOPE, request.request_id, decision);
    if (outcome.replayed) {
        statsd_client_->increment(MetricsDefinitions::BUDGET_DUPLICATE);
        logger_->debug("Ledger replayed budget decision for " + request.request_id);
    } else {
        recordDecision(decision, request);
    }
    return decision;
}

CommitResult IdempotentBudgetController::commitUsage(const std::string& reservation_id, int64_t actual_tokens) {
    if (reservation_id.empty()) {
        throw ValidationError("reservation_id must not be empty");
    }
    CommitResult result = ledger_->commit(reservation_id, actual_tokens);
    if (result.status == CommitStatus::COMMITTED) {
        statsd_client_->increment(MetricsDefinitions::BUDGET_COMMITTED);
        logger_->info("Budget committed: reservation " + reservation_id + " - " + std::to_string(result.charged)
            + " tokens charged, " + std::to_string(result.released) + " released");
    } else {
        logger_->debug("Reservation " + reservation_id + " already committed");
    }
    return result;
}

ReleaseResult IdempotentBudgetController::releaseReservation(const std::string& reservation_id) {
    if (reservation_id.empty()) {
        throw ValidationError("reservation_id must not be empty");
    }
    ReleaseResult result = ledger_->release(reservation_id);
    if (result.status == ReleaseStatus::RELEASED) {
        statsd_client_->increment(MetricsDefinitions::BUDGET_RELEASED);
        logger_->info("Budget released: reservation " + reservation_id + " - " + std::to_string(result.released) + " tokens");
    } else {
        logger_->debug("Reservation " + reservation_id + " already released");
    }
    return result;
}

BudgetState IdempotentBudgetController::budgetState(const std::string& tenant_id, const std::string& project_id) {
    if (tenant_id.empty() || project_id.empty()) {
        throw ValidationError("tenant_id and project_id must not be empty");
    }
    BudgetState state;
    auto account = ledger_->account(AccountKey{tenant_id, project_id});
    if (!account) {
        state.total = default_token_limit_;
        state.available = default_token_limit_;
        return state;
    }
    state.total = account->total_limit;
    state.used = account->used;
    state.reserved = account->reserved;
    state.available = account->available();
    return state;
}

void IdempotentBudgetController::setLimit(const std::string& tenant_id, const std::string& project_id, int64_t total_limit) {
    if (tenant_id.empty() || project_id.empty()) {
        throw ValidationError("tenant_id and project_id must not be empty");
    }
    AccountKey key{tenant_id, project_id};
    ledger_->setLimit(key, total_limit);
    logger_->warn("Budget limit for " + key.to_string() + " set to " + std::to_string(total_limit));
}

int IdempotentBudgetController::sweepExpiredReservations(std::chrono::seconds max_age) {
    auto cutoff = clock_->systemNow() - max_age;
    int released = 0;
    for (const auto& reservation : ledger_->activeReservationsOlderThan(cutoff)) {
        try {
            if (ledger_->release(reservation.reservation_id).status == ReleaseStatus::RELEASED) {
                ++released;
                logger_->warn("Released abandoned reservation " + reservation.reservation_id + " on "
                    + reservation.key.to_string() + " (" + std::to_string(reservation.amount) + " tokens, task "
                    + reservation.task_id + ")");
            }
        } catch (const ValidationError& e) {
            // Committed between the scan and the release.
            logger_->debug("Skipping reservation " + reservation.reservation_id + ": " + e.what());
        }
    }
    if (released > 0) {
        statsd_client_->increment(MetricsDefinitions::BUDGET_SWEPT, released);
    }
    return released;
}
