#include "InMemoryBudgetLedger.hpp"

#include <algorithm>
#include <stdexcept>

#include "../core/Errors.hpp"
#include "../core/IdGenerator.hpp"

namespace {
bool sameRequest(const TokenRequest& a, const TokenRequest& b) {
    return a.tenant_id == b.tenant_id
        && a.project_id == b.project_id
        && a.task_id == b.task_id
        && a.model == b.model
        && a.estimated_tokens == b.estimated_tokens;
}

BudgetTransaction transactionFor(const Reservation& reservation, TransactionType type, int64_t amount) {
    BudgetTransaction tx;
    tx.account_key = reservation.key;
    tx.request_id = reservation.request_id;
    tx.reservation_id = reservation.reservation_id;
    tx.task_id = reservation.task_id;
    tx.type = type;
    tx.amount = amount;
    return tx;
}
}

InMemoryBudgetLedger::InMemoryBudgetLedger(std::shared_ptr<ILogger> logger, std::shared_ptr<IClock> clock)
    : logger_(logger), clock_(clock) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for InMemoryBudgetLedger");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for InMemoryBudgetLedger");
    }
}

std::shared_ptr<InMemoryBudgetLedger::AccountRow> InMemoryBudgetLedger::findRow(const AccountKey& key) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = rows_.find(key);
    return it == rows_.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryBudgetLedger::AccountRow> InMemoryBudgetLedger::findOrCreateRow(const AccountKey& key, int64_t default_limit) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto& row = rows_[key];
    if (!row) {
        row = std::make_shared<AccountRow>();
        row->account.key = key;
        row->account.total_limit = default_limit;
        logger_->info("Created budget account " + key.to_string() + " with limit " + std::to_string(default_limit));
    }
    return row;
}

std::shared_ptr<InMemoryBudgetLedger::AccountRow> InMemoryBudgetLedger::rowForReservation(const std::string& reservation_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = reservation_index_.find(reservation_id);
    if (it == reservation_index_.end()) {
        throw ValidationError("Unknown reservation: " + reservation_id);
    }
    return rows_.at(it->second);
}

void InMemoryBudgetLedger::appendLocked(AccountRow& row, BudgetTransaction tx) {
    tx.sequence = next_sequence_++;
    tx.timestamp = clock_->systemNow();
    row.transactions.push_back(std::move(tx));
}

ReserveOutcome InMemoryBudgetLedger::reserve(const TokenRequest& request, int64_t default_limit) {
    if (request.estimated_tokens <= 0) {
        throw ValidationError("estimated_tokens must be positive");
    }
    const AccountKey key = request.accountKey();

    const bool claimed = claimRequest(request.request_id, key);
    auto row = findOrCreateRow(key, default_limit);
    try {
        return reserveLocked(*row, request);
    } catch (...) {
        if (claimed) {
            unclaimRequest(*row, request.request_id);
        }
        throw;
    }
}

bool InMemoryBudgetLedger::claimRequest(const std::string& request_id, const AccountKey& key) {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto claim = request_index_.try_emplace(request_id, key);
    if (!claim.second && !(claim.first->second == key)) {
        throw ValidationError("request_id " + request_id + " was already used for account " + claim.first->second.to_string());
    }
    return claim.second;
}

void InMemoryBudgetLedger::unclaimRequest(AccountRow& row, const std::string& request_id) {
    std::lock_guard<std::mutex> row_lock(row.mutex);
    if (row.requests.count(request_id) != 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(index_mutex_);
    request_index_.erase(request_id);
}

ReserveOutcome InMemoryBudgetLedger::reserveLocked(AccountRow& row, const TokenRequest& request) {
    std::lock_guard<std::mutex> row_lock(row.mutex);
    const AccountKey key = request.accountKey();

    auto existing = row.requests.find(request.request_id);
    if (existing != row.requests.end()) {
        if (!sameRequest(existing->second.request, request)) {
            throw ValidationError("request_id " + request.request_id + " was reused with different parameters");
        }
        ReserveOutcome replay = existing->second.outcome;
        replay.replayed = true;
        return replay;
    }

    BudgetAccount& account = row.account;
    ReserveOutcome outcome;
    outcome.timestamp = clock_->systemNow();

    BudgetTransaction tx;
    tx.account_key = key;
    tx.request_id = request.request_id;
    tx.task_id = request.task_id;
    tx.amount = request.estimated_tokens;
    tx.purpose = request.purpose;
    tx.model = request.model;

    if (account.used + account.reserved + request.estimated_tokens <= account.total_limit) {
        Reservation reservation;
        reservation.reservation_id = IdGenerator::next();
        reservation.request_id = request.request_id;
        reservation.task_id = request.task_id;
        reservation.key = key;
        reservation.amount = request.estimated_tokens;
        reservation.created_at = outcome.timestamp;

        account.reserved += request.estimated_tokens;
        tx.type = TransactionType::RESERVE;
        tx.reservation_id = reservation.reservation_id;

        outcome.approved = true;
        outcome.reservation_id = reservation.reservation_id;
        outcome.allocated = request.estimated_tokens;

        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            reservation_index_[reservation.reservation_id] = key;
        }
        row.reservations.emplace(reservation.reservation_id, std::move(reservation));
    } else {
        tx.type = TransactionType::REJECT;
        outcome.approved = false;
        outcome.allocated = 0;
    }
    outcome.available = account.available();
    appendLocked(row, std::move(tx));

    row.requests.emplace(request.request_id, RequestRecord{request, outcome});
    return outcome;
}

std::optional<ReserveOutcome> InMemoryBudgetLedger::findOutcome(const std::string& request_id) {
    std::shared_ptr<AccountRow> row;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = request_index_.find(request_id);
        if (it == request_index_.end()) {
            return std::nullopt;
        }
        // A claimed request_id has no row or outcome until its reserve finishes.
        auto row_it = rows_.find(it->second);
        if (row_it == rows_.end()) {
            return std::nullopt;
        }
        row = row_it->second;
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    auto it = row->requests.find(request_id);
    if (it == row->requests.end()) {
        return std::nullopt;
    }
    ReserveOutcome outcome = it->second.outcome;
    outcome.replayed = true;
    return outcome;
}

CommitResult InMemoryBudgetLedger::commit(const std::string& reservation_id, int64_t actual_tokens) {
    if (actual_tokens < 0) {
        throw ValidationError("actual_tokens cannot be negative");
    }
    auto row = rowForReservation(reservation_id);
    std::lock_guard<std::mutex> row_lock(row->mutex);

    Reservation& reservation = row->reservations.at(reservation_id);
    CommitResult result;
    result.reservation_id = reservation_id;

    switch (reservation.state) {
        case ReservationState::RELEASED:
            throw ValidationError("Reservation " + reservation_id + " was already released");
        case ReservationState::COMMITTED:
            result.status = CommitStatus::ALREADY_COMMITTED;
            result.charged = reservation.charged;
            result.unbilled = reservation.unbilled;
            result.released = std::max<int64_t>(reservation.amount - (reservation.charged + reservation.unbilled), 0);
            return result;
        case ReservationState::ACTIVE:
            break;
    }

    BudgetAccount& account = row->account;
    account.reserved -= reservation.amount;
    // Overage can only consume headroom that is still free.
    int64_t headroom = std::max<int64_t>(account.total_limit - account.used - account.reserved, 0);
    int64_t charged = std::min(actual_tokens, headroom);
    account.used += charged;

    reservation.state = ReservationState::COMMITTED;
    reservation.charged = charged;
    reservation.unbilled = actual_tokens - charged;

    BudgetTransaction tx = transactionFor(reservation, TransactionType::COMMIT, charged);
    tx.purpose = "actual_usage";
    appendLocked(*row, std::move(tx));

    result.status = CommitStatus::COMMITTED;
    result.charged = charged;
    result.unbilled = reservation.unbilled;
    result.released = std::max<int64_t>(reservation.amount - actual_tokens, 0);

    if (result.unbilled > 0) {
        logger_->warn("Reservation " + reservation_id + " on " + account.key.to_string() + " exceeded its limit: "
            + std::to_string(result.unbilled) + " tokens unbilled");
    }
    return result;
}

ReleaseResult InMemoryBudgetLedger::release(const std::string& reservation_id) {
    auto row = rowForReservation(reservation_id);
    std::lock_guard<std::mutex> row_lock(row->mutex);

    Reservation& reservation = row->reservations.at(reservation_id);
    ReleaseResult result;
    result.reservation_id = reservation_id;

    switch (reservation.state) {
        case ReservationState::COMMITTED:
            throw ValidationError("Reservation " + reservation_id + " was already committed");
        case ReservationState::RELEASED:
            result.status = ReleaseStatus::ALREADY_RELEASED;
            result.released = reservation.amount;
            return result;
        case ReservationState::ACTIVE:
            break;
    }

    row->account.reserved -= reservation.amount;
    reservation.state = ReservationState::RELEASED;

    BudgetTransaction tx = transactionFor(reservation, TransactionType::RELEASE, reservation.amount);
    tx.purpose = "cancelled";
    appendLocked(*row, std::move(tx));

    result.status = ReleaseStatus::RELEASED;
    result.released = reservation.amount;
    return result;
}

std::optional<BudgetAccount> InMemoryBudgetLedger::account(const AccountKey& key) {
    auto row = findRow(key);
    if (!row) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    return row->account;
}

std::vector<BudgetTransaction> InMemoryBudgetLedger::transactions(const AccountKey& key) {
    auto row = findRow(key);
    if (!row) {
        return {};
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    return row->transactions;
}

std::optional<Reservation> InMemoryBudgetLedger::reservation(const std::string& reservation_id) {
    std::shared_ptr<AccountRow> row;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = reservation_index_.find(reservation_id);
        if (it == reservation_index_.end()) {
            return std::nullopt;
        }
        row = rows_.at(it->second);
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    return row->reservations.at(reservation_id);
}

std::vector<Reservation> InMemoryBudgetLedger::activeReservationsOlderThan(std::chrono::system_clock::time_point cutoff) {
    std::vector<std::shared_ptr<AccountRow>> rows;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        for (const auto& entry : rows_) {
            rows.push_back(entry.second);
        }
    }

    std::vector<Reservation> stale;
    for (const auto& row : rows) {
        std::lock_guard<std::mutex> row_lock(row->mutex);
        for (const auto& entry : row->reservations) {
            const Reservation& reservation = entry.second;
            if (reservation.state == ReservationState::ACTIVE && reservation.created_at < cutoff) {
                stale.push_back(reservation);
            }
        }
    }
    std::sort(stale.begin(), stale.end(), [](const Reservation& a, const Reservation& b) {
        return a.created_at < b.created_at;
    });
    return stale;
}

void InMemoryBudgetLedger::setLimit(const AccountKey& key, int64_t total_limit) {
    if (total_limit < 0) {
        throw ValidationError("total_limit cannot be negative");
    }
    auto row = findOrCreateRow(key, total_limit);
    std::lock_guard<std::mutex> row_lock(row->mutex);
    BudgetAccount& account = row->account;
    if (total_limit < account.used + account.reserved) {
        throw ValidationError("Limit " + std::to_string(total_limit) + " for " + key.to_string()
            + " is below committed plus reserved tokens (" + std::to_string(account.used + account.reserved) + ")");
    }
    account.total_limit = total_limit;
}
