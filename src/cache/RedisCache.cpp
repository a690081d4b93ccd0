#include <memory>
#include <stdexcept>
#include <string>

#include <hiredis/hiredis.h>

#include "RedisCache.hpp"
#include "../interfaces/ILogger.hpp"

namespace {
struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) {
            freeReplyObject(reply);
        }
    }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;
}

RedisCache::RedisCache(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : config_(config), logger_(logger), redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisCache");
    }
    connect();
}

RedisCache::~RedisCache() {
    if (redis_context_) {
        redisFree(redis_context_);
    }
}

void RedisCache::connect() {
    redis_context_ = redisConnect(config_.redis_host.c_str(), config_.redis_port);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            redisFree(redis_context_);
            redis_context_ = nullptr;
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
        return;
    }
    logger_->setup("Connected to Redis at " + config_.redis_host + ":" + std::to_string(config_.redis_port));
}

void RedisCache::handleNullReply(const std::string& command, const std::string& key) {
    std::string reason = redis_context_ && redis_context_->err ? std::string(redis_context_->errstr) : "no reply";
    logger_->error("Redis " + command + " failed for key '" + key + "': " + reason);
    if (redis_context_ && redis_context_->err) {
        redisFree(redis_context_);
        redis_context_ = nullptr;
    }
}

bool RedisCache::set(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot SET key: " + key);
        return false;
    }

    int effective_ttl = ttl > 0 ? ttl : config_.idempotency_ttl_seconds;
    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_,
        "SETEX %s %d %b",
        key.c_str(),
        effective_ttl,
        value.data(), value.size())));

    if (!reply) {
        handleNullReply("SETEX", key);
        return false;
    }
    return reply->type != REDIS_REPLY_ERROR;
}

CacheInsertResult RedisCache::setIfAbsent(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot SET NX key: " + key);
        return CacheInsertResult::Unavailable;
    }

    int effective_ttl = ttl > 0 ? ttl : config_.idempotency_ttl_seconds;
    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_,
        "SET %s %b NX EX %d",
        key.c_str(),
        value.data(), value.size(),
        effective_ttl)));

    if (!reply) {
        handleNullReply("SET NX", key);
        return CacheInsertResult::Unavailable;
    }
    switch (reply->type) {
        case REDIS_REPLY_STATUS:
            return CacheInsertResult::Inserted;
        case REDIS_REPLY_NIL:
            return CacheInsertResult::AlreadyExists;
        default:
            logger_->error("Unexpected Redis reply type " + std::to_string(reply->type) + " for SET NX on key: " + key);
            return CacheInsertResult::Unavailable;
    }
}

std::optional<std::string> RedisCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot GET key: " + key);
        return std::nullopt;
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, "GET %s", key.c_str())));
    if (!reply) {
        handleNullReply("GET", key);
        return std::nullopt;
    }
    if (reply->type == REDIS_REPLY_STRING) {
        return std::string(reply->str, reply->len);
    }
    return std::nullopt;
}

bool RedisCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot DEL key: " + key);
        return false;
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, "DEL %s", key.c_str())));
    if (!reply) {
        handleNullReply("DEL", key);
        return false;
    }
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot FLUSHDB.");
        return false;
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, "FLUSHDB")));
    if (!reply) {
        handleNullReply("FLUSHDB", "*");
        return false;
    }
    return reply->type != REDIS_REPLY_ERROR;
}

bool RedisCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!redis_context_) {
        logger_->error("Redis not connected. Cannot check EXISTS for key: " + key);
        return false;
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, "EXISTS %s", key.c_str())));
    if (!reply) {
        handleNullReply("EXISTS", key);
        return false;
    }
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}
