#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/CacheInterface.hpp"

struct CacheEntry {
    std::string value;
    std::chrono::time_point<std::chrono::steady_clock> expiry; // steady_clock for TTL
    std::list<std::string>::iterator lru_position;
};

// Process-local fallback used when Redis is disabled or unreachable.
// TTL expiry plus LRU eviction once max_size entries are held.
class InMemoryCache : public CacheInterface {
private:
    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lru_list_; // front = most recent, back = least recent

    mutable std::mutex mutex_;
    const int default_ttl_seconds_;
    const size_t max_size_;

    // Caller holds mutex_. Returns the live entry or end(); an expired entry is erased.
    std::unordered_map<std::string, CacheEntry>::iterator findLive(const std::string& key);
    void insertLocked(const std::string& key, const std::string& value, int ttl);
    void eraseLocked(std::unordered_map<std::string, CacheEntry>::iterator it);
    void evictIfNeeded();

public:
    explicit InMemoryCache(int default_ttl_seconds = 300, size_t max_size = 10000);

    ~InMemoryCache() override = default;

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    CacheInsertResult setIfAbsent(const std::string& key, const std::string& value, int ttl) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool exists(const std::string& key) override;

    size_t size() const;
};

#endif // INMEMORYCACHE_HPP
