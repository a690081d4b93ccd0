#include "InMemoryDeadLetterStore.hpp"

#include "../core/Errors.hpp"

void InMemoryDeadLetterStore::insert(const DeadLetterMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!messages_.emplace(message.id, message).second) {
        throw ValidationError("Dead letter " + message.id + " already exists");
    }
    order_.push_back(message.id);
}

std::optional<DeadLetterMessage> InMemoryDeadLetterStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeadLetterMessage> InMemoryDeadLetterStore::list(std::optional<bool> resolved, size_t limit, size_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeadLetterMessage> page;
    size_t skipped = 0;
    for (auto it = order_.rbegin(); it != order_.rend() && page.size() < limit; ++it) {
        const DeadLetterMessage& message = messages_.at(*it);
        if (resolved && message.resolved != *resolved) {
            continue;
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        page.push_back(message);
    }
    return page;
}

bool InMemoryDeadLetterStore::markResolved(const std::string& id,
                                           const std::string& note,
                                           bool requeued,
                                           std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        throw ValidationError("Unknown dead letter: " + id);
    }
    DeadLetterMessage& message = it->second;
    if (message.resolved) {
        return false;
    }
    message.resolved = true;
    message.resolution_note = note;
    message.requeued = requeued;
    message.resolved_at = at;
    if (requeued) {
        // The republished copy starts over.
        message.attempt_count = 0;
    }
    return true;
}

size_t InMemoryDeadLetterStore::countUnresolved() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : messages_) {
        if (!entry.second.resolved) {
            ++count;
        }
    }
    return count;
}
