#include "IdempotencyStore.hpp"

#include <stdexcept>

namespace {
const std::string KEY_PREFIX = "steward:idem:";
const std::string CLAIM_MARKER = "in_progress";
}

IdempotencyStore::IdempotencyStore(std::shared_ptr<CacheInterface> cache, std::shared_ptr<ILogger> logger, int ttl_seconds)
    : cache_(cache), logger_(logger), ttl_seconds_(ttl_seconds) {
    if (!cache_) {
        throw std::invalid_argument("Cache cannot be null for IdempotencyStore");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for IdempotencyStore");
    }
    if (ttl_seconds_ <= 0) {
        throw std::invalid_argument("Idempotency TTL must be positive");
    }
}

std::string IdempotencyStore::claimKey(const std::string& scope, const std::string& request_id) {
    return KEY_PREFIX + scope + ":" + request_id;
}

std::string IdempotencyStore::resultKey(const std::string& scope, const std::string& request_id) {
    return claimKey(scope, request_id) + ":result";
}

CacheInsertResult IdempotencyStore::claim(const std::string& scope, const std::string& request_id) {
    CacheInsertResult result = cache_->setIfAbsent(claimKey(scope, request_id), CLAIM_MARKER, ttl_seconds_);
    if (result == CacheInsertResult::Unavailable) {
        logger_->warn("Idempotency cache unavailable while claiming " + scope + ":" + request_id);
    }
    return result;
}

std::optional<nlohmann::json> IdempotencyStore::lookup(const std::string& scope, const std::string& request_id) {
    const std::string key = resultKey(scope, request_id);
    auto raw = cache_->get(key);
    if (!raw) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::parse_error& e) {
        logger_->error("Discarding unparseable idempotency entry '" + key + "': " + e.what());
        cache_->remove(key);
        return std::nullopt;
    }
}

bool IdempotencyStore::store(const std::string& scope, const std::string& request_id, const nlohmann::json& result) {
    if (!cache_->set(resultKey(scope, request_id), result.dump(), ttl_seconds_)) {
        logger_->warn("Failed to cache idempotent result for " + scope + ":" + request_id);
        return false;
    }
    return true;
}

void IdempotencyStore::abandon(const std::string& scope, const std::string& request_id) {
    if (!cache_->remove(claimKey(scope, request_id))) {
        logger_->debug("No idempotency claim to drop for " + scope + ":" + request_id);
    }
}
