#include "DeadLetterQueue.hpp"

#include <stdexcept>

#include "../config/AppConfig.hpp"
#include "../core/Errors.hpp"
#include "../core/IdGenerator.hpp"

DeadLetterQueue::DeadLetterQueue(std::shared_ptr<IDeadLetterStore> store,
                                 std::shared_ptr<IMessageTransport> transport,
                                 std::shared_ptr<IAlertSink> alert_sink,
                                 std::shared_ptr<IStatsDClient> statsd_client,
                                 std::shared_ptr<ILogger> logger,
                                 std::shared_ptr<IClock> clock,
                                 int max_attempts)
    : store_(store),
      transport_(transport),
      alert_sink_(alert_sink),
      statsd_client_(statsd_client),
      logger_(logger),
      clock_(clock),
      max_attempts_(max_attempts) {
    if (!store_ || !transport_ || !alert_sink_ || !statsd_client_ || !logger_ || !clock_) {
        throw std::invalid_argument("DeadLetterQueue dependencies cannot be null");
    }
    if (max_attempts_ < 1) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
}

std::string DeadLetterQueue::enqueue(const std::string& destination, const nlohmann::json& payload, const std::string& error) {
    if (destination.empty()) {
        throw ValidationError("destination must not be empty");
    }
    DeadLetterMessage message;
    message.id = IdGenerator::next();
    message.original_destination = destination;
    message.payload = payload;
    message.last_error = error;
    message.attempt_count = max_attempts_;
    message.max_attempts = max_attempts_;
    message.created_at = clock_->systemNow();
    return insertAndAlert(std::move(message));
}

std::string DeadLetterQueue::park(const WorkItem& item) {
    DeadLetterMessage message;
    message.id = item.id.empty() ? IdGenerator::next() : item.id;
    message.original_destination = item.destination;
    message.payload = item.payload;
    message.last_error = item.last_error;
    message.attempt_count = item.attempt_count;
    message.max_attempts = item.max_attempts;
    message.created_at = clock_->systemNow();
    return insertAndAlert(std::move(message));
}

std::string DeadLetterQueue::insertAndAlert(DeadLetterMessage message) {
    store_->insert(message);
    statsd_client_->increment(MetricsDefinitions::DLQ_EXHAUSTED);
    logger_->error("Dead-lettered message " + message.id + " for " + message.original_destination + " after "
        + std::to_string(message.attempt_count) + " attempts: " + message.last_error);

    Alert alert;
    alert.severity = AlertSeverity::CRITICAL;
    alert.source = "dead_letter_queue";
    alert.summary = "Message for '" + message.original_destination + "' failed permanently";
    alert.details = {
        {"message_id", message.id},
        {"destination", message.original_destination},
        {"attempt_count", message.attempt_count},
        {"max_attempts", message.max_attempts},
        {"last_error", message.last_error}
    };
    alert_sink_->raise(alert);
    return message.id;
}

ResolveResult DeadLetterQueue::resolve(const std::string& id, const std::string& note, bool requeue) {
    std::lock_guard<std::mutex> lock(resolve_mutex_);

    auto message = store_->get(id);
    if (!message) {
        throw ValidationError("Unknown dead letter: " + id);
    }

    ResolveResult result;
    result.message_id = id;
    if (message->resolved) {
        result.status = ResolveStatus::ALREADY_RESOLVED;
        result.requeued = message->requeued;
        logger_->debug("Dead letter " + id + " already resolved");
        return result;
    }

    if (requeue) {
        transport_->publish(message->original_destination, message->payload);
        statsd_client_->increment(MetricsDefinitions::DLQ_REQUEUED);
    }

    if (!store_->markResolved(id, note, requeue, clock_->systemNow())) {
        result.status = ResolveStatus::ALREADY_RESOLVED;
        return result;
    }

    statsd_client_->increment(MetricsDefinitions::DLQ_RESOLVED);
    logger_->warn("Dead letter " + id + (requeue ? " requeued to " + message->original_destination : " dropped")
        + (note.empty() ? "" : ": " + note));

    result.status = ResolveStatus::RESOLVED;
    result.requeued = requeue;
    return result;
}

std::optional<DeadLetterMessage> DeadLetterQueue::get(const std::string& id) {
    return store_->get(id);
}

std::vector<DeadLetterMessage> DeadLetterQueue::list(std::optional<bool> resolved, size_t limit, size_t offset) {
    return store_->list(resolved, limit, offset);
}

size_t DeadLetterQueue::countUnresolved() {
    return store_->countUnresolved();
}
