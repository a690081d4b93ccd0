#include "GovernanceLimiter.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../core/Errors.hpp"
#include "../core/IdGenerator.hpp"

namespace {
const std::chrono::hours DAILY_WINDOW(24);

void pruneWindow(GovernanceRow& row, std::chrono::system_clock::time_point now) {
    while (!row.updates.empty() && row.updates.front().first <= now - DAILY_WINDOW) {
        row.updates.pop_front();
    }
}

int autoUpdatesInWindow(const GovernanceRow& row) {
    return static_cast<int>(std::count_if(row.updates.begin(), row.updates.end(), [](const auto& update) {
        return update.second == UpdateKind::AUTO;
    }));
}

GovernanceDecision decision(bool allowed, const char* reason) {
    return GovernanceDecision{allowed, reason};
}
}

GovernanceLimiter::GovernanceLimiter(std::shared_ptr<IGovernanceStore> store,
                                     std::shared_ptr<IStatsDClient> statsd_client,
                                     std::shared_ptr<ILogger> logger,
                                     std::shared_ptr<IClock> clock)
    : store_(store), statsd_client_(statsd_client), logger_(logger), clock_(clock) {
    if (!store_) {
        throw std::invalid_argument("GovernanceStore cannot be null for GovernanceLimiter");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for GovernanceLimiter");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for GovernanceLimiter");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for GovernanceLimiter");
    }
}

GovernanceDecision GovernanceLimiter::evaluateLocked(GovernanceRow& row, std::chrono::system_clock::time_point now) const {
    pruneWindow(row, now);
    const GovernanceRule& rule = row.rule;
    if (rule.requires_human_approval) {
        return decision(false, GovernanceDecision::REQUIRES_APPROVAL);
    }
    if (rule.last_update_at && now - *rule.last_update_at < rule.cooldown) {
        return decision(false, GovernanceDecision::COOLDOWN_ACTIVE);
    }
    if (autoUpdatesInWindow(row) >= rule.max_updates_per_day) {
        return decision(false, GovernanceDecision::DAILY_LIMIT_REACHED);
    }
    return decision(true, GovernanceDecision::ALLOWED);
}

void GovernanceLimiter::recordLocked(GovernanceRow& row, UpdateKind kind, std::chrono::system_clock::time_point now) const {
    pruneWindow(row, now);
    row.rule.last_update_at = now;
    row.updates.emplace_back(now, kind);
}

void GovernanceLimiter::countDecision(const std::string& role, const GovernanceDecision& decision) {
    if (decision.allowed) {
        statsd_client_->increment(MetricsDefinitions::GOVERNANCE_ALLOWED);
    } else {
        statsd_client_->increment(MetricsDefinitions::GOVERNANCE_DENIED);
        logger_->info("Governance denied auto-update for role '" + role + "': " + decision.reason);
    }
}

GovernanceDecision GovernanceLimiter::evaluate(const std::string& role) {
    auto now = clock_->systemNow();
    GovernanceDecision result = decision(false, GovernanceDecision::UNKNOWN_ROLE);
    store_->withRule(role, [&](GovernanceRow& row) {
        result = evaluateLocked(row, now);
    });
    countDecision(role, result);
    return result;
}

bool GovernanceLimiter::canAutoUpdate(const std::string& role) {
    return evaluate(role).allowed;
}

GovernanceDecision GovernanceLimiter::tryAutoUpdate(const std::string& role) {
    auto now = clock_->systemNow();
    GovernanceDecision result = decision(false, GovernanceDecision::UNKNOWN_ROLE);
    store_->withRule(role, [&](GovernanceRow& row) {
        result = evaluateLocked(row, now);
        if (result.allowed) {
            recordLocked(row, UpdateKind::AUTO, now);
        }
    });
    countDecision(role, result);
    if (result.allowed) {
        logger_->info("Recorded auto-update for role '" + role + "'");
    }
    return result;
}

void GovernanceLimiter::recordUpdate(const std::string& role, UpdateKind kind) {
    if (role.empty()) {
        throw ValidationError("role must not be empty");
    }
    auto now = clock_->systemNow();
    GovernanceRule defaults;
    defaults.role = role;
    store_->withRuleOrCreate(role, defaults, [&](GovernanceRow& row) {
        recordLocked(row, kind, now);
    });
    logger_->info(std::string("Recorded ") + (kind == UpdateKind::AUTO ? "auto" : "approved")
        + " update for role '" + role + "'");
}

std::string GovernanceLimiter::submitForApproval(const std::string& role, const std::string& description) {
    if (role.empty()) {
        throw ValidationError("role must not be empty");
    }
    if (description.empty()) {
        throw ValidationError("description must not be empty");
    }
    ApprovalRequest request;
    request.id = IdGenerator::next();
    request.role = role;
    request.description = description;
    request.status = ApprovalStatus::PENDING_REVIEW;
    request.created_at = clock_->systemNow();
    store_->insertApproval(request);
    logger_->info("Approval " + request.id + " submitted for role '" + role + "': " + description);
    return request.id;
}

ApprovalRequest GovernanceLimiter::decide(const std::string& id, const std::string& approver,
                                          const std::string& note, ApprovalStatus outcome) {
    if (approver.empty()) {
        throw ValidationError("approver must not be empty");
    }
    auto now = clock_->systemNow();
    ApprovalRequest decided;
    bool found = store_->withApproval(id, [&](ApprovalRequest& request) {
        if (request.status != ApprovalStatus::PENDING_REVIEW) {
            throw ValidationError("Approval " + id + " was already decided (" + toString(request.status) + ")");
        }
        request.status = outcome;
        request.decided_by = approver;
        request.note = note;
        request.decided_at = now;
        decided = request;
    });
    if (!found) {
        throw ValidationError("Unknown approval request: " + id);
    }
    return decided;
}

ApprovalRequest GovernanceLimiter::approve(const std::string& id, const std::string& approver, const std::string& note) {
    ApprovalRequest request = decide(id, approver, note, ApprovalStatus::HUMAN_APPROVED);
    recordUpdate(request.role, UpdateKind::APPROVED);
    statsd_client_->increment(MetricsDefinitions::GOVERNANCE_APPROVED);
    logger_->warn("Approval " + id + " for role '" + request.role + "' approved by " + approver);
    return request;
}

ApprovalRequest GovernanceLimiter::reject(const std::string& id, const std::string& approver, const std::string& reason) {
    ApprovalRequest request = decide(id, approver, reason, ApprovalStatus::REJECTED);
    statsd_client_->increment(MetricsDefinitions::GOVERNANCE_REJECTED);
    logger_->warn("Approval " + id + " for role '" + request.role + "' rejected by " + approver
        + (reason.empty() ? "" : ": " + reason));
    return request;
}

std::vector<ApprovalRequest> GovernanceLimiter::pendingApprovals() {
    return store_->approvals(ApprovalStatus::PENDING_REVIEW);
}

std::optional<GovernanceStatus> GovernanceLimiter::status(const std::string& role) {
    auto now = clock_->systemNow();
    std::optional<GovernanceStatus> result;
    store_->withRule(role, [&](GovernanceRow& row) {
        GovernanceDecision current = evaluateLocked(row, now);
        GovernanceStatus status;
        status.rule = row.rule;
        status.auto_updates_last_24h = autoUpdatesInWindow(row);
        status.status = current.allowed ? CAN_AUTO_UPDATE : current.reason;
        result = status;
    });
    if (!result) {
        return std::nullopt;
    }
    for (const auto& request : pendingApprovals()) {
        if (request.role == role) {
            ++result->pending_count;
        }
    }
    return result;
}

std::vector<GovernanceStatus> GovernanceLimiter::allStatuses() {
    std::vector<GovernanceStatus> statuses;
    for (const auto& role : store_->roles()) {
        if (auto current = status(role)) {
            statuses.push_back(*current);
        }
    }
    return statuses;
}

void GovernanceLimiter::upsertRule(const GovernanceRule& rule) {
    if (rule.role.empty()) {
        throw ValidationError("Governance rule needs a role");
    }
    if (rule.max_updates_per_day < 0 || rule.cooldown.count() < 0) {
        throw ValidationError("Governance rule for '" + rule.role + "' has negative limits");
    }
    store_->upsertRule(rule);
    logger_->warn("Governance rule for role '" + rule.role + "' set to " + std::to_string(rule.max_updates_per_day)
        + "/day, cooldown " + std::to_string(rule.cooldown.count()) + "s, approval "
        + (rule.requires_human_approval ? "required" : "not required"));
}
