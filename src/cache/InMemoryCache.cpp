#include "InMemoryCache.hpp"

#include <chrono>

using namespace std::chrono;

InMemoryCache::InMemoryCache(int default_ttl_seconds, size_t max_size)
    : default_ttl_seconds_(default_ttl_seconds), max_size_(max_size == 0 ? 1 : max_size) {}

bool InMemoryCache::set(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(key, value, ttl);
    return true;
}

CacheInsertResult InMemoryCache::setIfAbsent(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (findLive(key) != cache_.end()) {
        return CacheInsertResult::AlreadyExists;
    }
    insertLocked(key, value, ttl);
    return CacheInsertResult::Inserted;
}

std::optional<std::string> InMemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = findLive(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    // Move accessed item to the front of the LRU list
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
    return it->second.value;
}

bool InMemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    eraseLocked(it);
    return true;
}

bool InMemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lru_list_.clear();
    return true;
}

bool InMemoryCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLive(key) != cache_.end();
}

size_t InMemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::unordered_map<std::string, CacheEntry>::iterator InMemoryCache::findLive(const std::string& key) {
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second.expiry <= steady_clock::now()) {
        eraseLocked(it);
        return cache_.end();
    }
    return it;
}

void InMemoryCache::insertLocked(const std::string& key, const std::string& value, int ttl) {
    int effective_ttl = (ttl > 0) ? ttl : default_ttl_seconds_;
    auto expiry = steady_clock::now() + seconds(effective_ttl);

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second.value = value;
        it->second.expiry = expiry;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
        return;
    }

    evictIfNeeded();
    lru_list_.push_front(key);
    cache_.emplace(key, CacheEntry{value, expiry, lru_list_.begin()});
}

void InMemoryCache::eraseLocked(std::unordered_map<std::string, CacheEntry>::iterator it) {
    lru_list_.erase(it->second.lru_position);
    cache_.erase(it);
}

// Expired entries are dropped lazily on access or when they reach the LRU tail.
void InMemoryCache::evictIfNeeded() {
    while (cache_.size() >= max_size_ && !lru_list_.empty()) {
        cache_.erase(lru_list_.back());
        lru_list_.pop_back();
    }
}
