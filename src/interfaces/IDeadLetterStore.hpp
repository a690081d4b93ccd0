#ifndef IDEADLETTERSTORE_HPP
#define IDEADLETTERSTORE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../models/DeadLetterMessage.hpp"

class IDeadLetterStore {
public:
    virtual ~IDeadLetterStore() = default;

    virtual void insert(const DeadLetterMessage& message) = 0;
    virtual std::optional<DeadLetterMessage> get(const std::string& id) = 0;
    // Newest first. An empty filter returns both resolved and unresolved messages.
    virtual std::vector<DeadLetterMessage> list(std::optional<bool> resolved, size_t limit, size_t offset) = 0;
    // Returns false when the message was already resolved. A requeued message
    // has its attempt_count reset to 0.
    virtual bool markResolved(const std::string& id,
                              const std::string& note,
                              bool requeued,
                              std::chrono::system_clock::time_point at) = 0;
    virtual size_t countUnresolved() = 0;
};

#endif // IDEADLETTERSTORE_HPP
