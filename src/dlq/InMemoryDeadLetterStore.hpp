#ifndef INMEMORYDEADLETTERSTORE_HPP
#define INMEMORYDEADLETTERSTORE_HPP

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../interfaces/IDeadLetterStore.hpp"

class InMemoryDeadLetterStore : public IDeadLetterStore {
public:
    ~InMemoryDeadLetterStore() override = default;

    void insert(const DeadLetterMessage& message) override;
    std::optional<DeadLetterMessage> get(const std::string& id) override;
    std::vector<DeadLetterMessage> list(std::optional<bool> resolved, size_t limit, size_t offset) override;
    bool markResolved(const std::string& id,
                      const std::string& note,
                      bool requeued,
                      std::chrono::system_clock::time_point at) override;
    size_t countUnresolved() override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DeadLetterMessage> messages_;
    // Insertion order, oldest first.
    std::vector<std::string> order_;
};

#endif // INMEMORYDEADLETTERSTORE_HPP
