#ifndef IDEMPOTENCYSTORE_HPP
#define IDEMPOTENCYSTORE_HPP

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"

// Claim/result bookkeeping for idempotency keys on top of a CacheInterface.
//
//   steward:idem:<scope>:<request_id>          claim marker
//   steward:idem:<scope>:<request_id>:result   serialised outcome
//
// Both keys share one TTL. The cache only saves work: callers must still be
// correct when an entry is missing or the cache is down.
class IdempotencyStore {
public:
    IdempotencyStore(std::shared_ptr<CacheInterface> cache, std::shared_ptr<ILogger> logger, int ttl_seconds);

    // Inserted: caller owns the request. AlreadyExists: someone else claimed it.
    CacheInsertResult claim(const std::string& scope, const std::string& request_id);
    std::optional<nlohmann::json> lookup(const std::string& scope, const std::string& request_id);
    bool store(const std::string& scope, const std::string& request_id, const nlohmann::json& result);
    // Drops the claim after the owning operation failed so a retry can proceed.
    void abandon(const std::string& scope, const std::string& request_id);

    int ttlSeconds() const { return ttl_seconds_; }

    static std::string claimKey(const std::string& scope, const std::string& request_id);
    static std::string resultKey(const std::string& scope, const std::string& request_id);

private:
    std::shared_ptr<CacheInterface> cache_;
    std::shared_ptr<ILogger> logger_;
    int ttl_seconds_;
};

#endif // IDEMPOTENCYSTORE_HPP
