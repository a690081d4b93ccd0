#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Shared cache for multi-instance deployments. A lost connection is reported
// through the return values and never thrown.
class RedisCache : public CacheInterface {
public:
    explicit RedisCache(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisCache() override;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    // SET key value NX EX ttl
    CacheInsertResult setIfAbsent(const std::string& key, const std::string& value, int ttl) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool exists(const std::string& key) override;

    // Check if the cache is connected to Redis
    bool isConnected() const;

private:
    void connect();
    // Caller holds mutex_. Drops the context after an I/O error so isConnected() reflects it.
    void handleNullReply(const std::string& command, const std::string& key);

    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;
};
