#ifndef DEADLETTERQUEUE_HPP
#define DEADLETTERQUEUE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../interfaces/IAlertSink.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/IDeadLetterStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMessageTransport.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Parking lot for work that ran out of retries, plus the operator actions on it.
// Messages are never deleted; resolution flips flags on the record.
class DeadLetterQueue {
public:
    DeadLetterQueue(std::shared_ptr<IDeadLetterStore> store,
                    std::shared_ptr<IMessageTransport> transport,
                    std::shared_ptr<IAlertSink> alert_sink,
                    std::shared_ptr<IStatsDClient> statsd_client,
                    std::shared_ptr<ILogger> logger,
                    std::shared_ptr<IClock> clock,
                    int max_attempts);

    DeadLetterQueue(const DeadLetterQueue&) = delete;
    DeadLetterQueue& operator=(const DeadLetterQueue&) = delete;

    // Parks a payload directly, bypassing retries. Returns the message id.
    std::string enqueue(const std::string& destination, const nlohmann::json& payload, const std::string& error);
    // Parks a work item whose retries are exhausted. Returns the message id.
    std::string park(const WorkItem& item);

    // requeue=true republishes the payload to its original destination with a
    // fresh attempt count before marking the message resolved; a publish
    // failure propagates and the message stays unresolved.
    ResolveResult resolve(const std::string& id, const std::string& note, bool requeue);

    std::optional<DeadLetterMessage> get(const std::string& id);
    std::vector<DeadLetterMessage> list(std::optional<bool> resolved, size_t limit = 100, size_t offset = 0);
    size_t countUnresolved();

private:
    std::string insertAndAlert(DeadLetterMessage message);

    std::shared_ptr<IDeadLetterStore> store_;
    std::shared_ptr<IMessageTransport> transport_;
    std::shared_ptr<IAlertSink> alert_sink_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IClock> clock_;
    int max_attempts_;

    // Serialises resolve() so a message is republished at most once.
    std::mutex resolve_mutex_;
};

#endif // DEADLETTERQUEUE_HPP
