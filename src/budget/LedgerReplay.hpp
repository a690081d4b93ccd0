#ifndef LEDGERREPLAY_HPP
#define LEDGERREPLAY_HPP

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/Errors.hpp"
#include "../models/BudgetModels.hpp"

struct ReplayedBalance {
    int64_t used = 0;
    int64_t reserved = 0;
};

// Rebuilds an account's {used, reserved} from its transaction log, in sequence
// order. REJECT rows carry no balance change. Throws ValidationError when a
// COMMIT or RELEASE refers to a reservation with no prior RESERVE.
inline ReplayedBalance replayTransactions(const std::vector<BudgetTransaction>& transactions) {
    ReplayedBalance balance;
    std::unordered_map<std::string, int64_t> open_reservations;

    for (const auto& tx : transactions) {
        switch (tx.type) {
            case TransactionType::RESERVE:
                open_reservations[tx.reservation_id] = tx.amount;
                balance.reserved += tx.amount;
                break;
            case TransactionType::COMMIT:
            case TransactionType::RELEASE: {
                auto it = open_reservations.find(tx.reservation_id);
                if (it == open_reservations.end()) {
                    throw ValidationError("Transaction " + std::to_string(tx.sequence)
                        + " closes unknown reservation " + tx.reservation_id);
                }
                balance.reserved -= it->second;
                if (tx.type == TransactionType::COMMIT) {
                    balance.used += tx.amount;
                }
                open_reservations.erase(it);
                break;
            }
            case TransactionType::REJECT:
                break;
        }
    }
    return balance;
}

#endif // LEDGERREPLAY_HPP
