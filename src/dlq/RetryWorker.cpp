#include "RetryWorker.hpp"

#include <stdexcept>

#include <boost/asio/post.hpp>

#include "../config/AppConfig.hpp"
#include "../core/IdGenerator.hpp"

RetryWorker::RetryWorker(RetryPolicy policy,
                         std::shared_ptr<ILogger> logger,
                         std::shared_ptr<IStatsDClient> statsd_client,
                         std::shared_ptr<IClock> clock)
    : policy_(policy),
      logger_(logger),
      statsd_client_(statsd_client),
      clock_(clock),
      work_guard_(net::make_work_guard(ioc_)) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RetryWorker");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for RetryWorker");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for RetryWorker");
    }
    if (policy_.max_attempts < 1) {
        throw std::invalid_argument("RetryPolicy max_attempts must be at least 1");
    }
}

RetryWorker::~RetryWorker() {
    stop();
}

void RetryWorker::registerHandler(const std::string& destination, Handler handler) {
    if (destination.empty() || !handler) {
        throw std::invalid_argument("Handler registration requires a destination and a callable");
    }
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[destination] = std::move(handler);
    logger_->info("Registered handler for destination " + destination);
}

void RetryWorker::onExhausted(ExhaustedCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    exhausted_callback_ = std::move(callback);
}

void RetryWorker::publish(const std::string& destination, const nlohmann::json& payload) {
    WorkItem item;
    item.id = IdGenerator::next();
    item.destination = destination;
    item.payload = payload;
    item.attempt_count = 0;
    item.max_attempts = policy_.max_attempts;
    item.created_at = clock_->systemNow();
    submit(std::move(item));
}

void RetryWorker::submit(WorkItem item) {
    if (stopped_) {
        throw std::runtime_error("RetryWorker is stopped; cannot accept work for " + item.destination);
    }
    if (item.max_attempts < 1) {
        item.max_attempts = policy_.max_attempts;
    }
    ++pending_;
    dispatch(std::move(item));
}

void RetryWorker::dispatch(WorkItem item) {
    net::post(ioc_, [this, item = std::move(item)]() mutable {
        attempt(std::move(item));
    });
}

void RetryWorker::start(size_t thread_count) {
    if (thread_count == 0) {
        throw std::invalid_argument("RetryWorker needs at least one thread");
    }
    if (!threads_.empty() || stopped_) {
        logger_->warn("RetryWorker already started or stopped; ignoring start()");
        return;
    }
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this] {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                logger_->critical("RetryWorker thread terminated: " + std::string(e.what()));
            }
        });
    }
    logger_->setup("RetryWorker started with " + std::to_string(thread_count) + " threads");
}

void RetryWorker::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    logger_->debug("Stopping RetryWorker...");
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        for (auto& entry : timers_) {
            entry.second->cancel();
        }
    }
    work_guard_.reset();
    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    if (pending_ > 0) {
        logger_->warn("RetryWorker stopped with " + std::to_string(pending_.load()) + " undelivered items");
    }
    logger_->debug("RetryWorker stopped.");
}

void RetryWorker::attempt(WorkItem item) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(item.destination);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        std::string error = "no handler for destination " + item.destination;
        onAttemptFailed(std::move(item), error);
        return;
    }

    try {
        handler(item);
    } catch (const std::exception& e) {
        onAttemptFailed(std::move(item), e.what());
        return;
    } catch (...) {
        onAttemptFailed(std::move(item), "non-standard exception");
        return;
    }
    --pending_;
    logger_->debug("Delivered " + item.id + " to " + item.destination);
}

void RetryWorker::onAttemptFailed(WorkItem item, const std::string& error) {
    item.attempt_count += 1;
    item.last_error = error;

    if (item.attempt_count >= item.max_attempts) {
        park(item);
        return;
    }

    auto delay = policy_.backoffFor(item.attempt_count);
    statsd_client_->increment(MetricsDefinitions::DLQ_RETRY_SCHEDULED);
    logger_->warn("Attempt " + std::to_string(item.attempt_count) + "/" + std::to_string(item.max_attempts)
        + " for " + item.id + " (" + item.destination + ") failed: " + error
        + ". Retrying in " + std::to_string(delay.count()) + "ms");
    scheduleRetry(std::move(item), delay);
}

void RetryWorker::scheduleRetry(WorkItem item, std::chrono::milliseconds delay) {
    auto timer = std::make_shared<net::steady_timer>(ioc_, delay);
    bool armed = false;
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        if (!stopped_) {
            timers_.emplace(timer.get(), timer);
            armed = true;
        }
    }
    if (!armed) {
        parkOnShutdown(std::move(item));
        return;
    }

    timer->async_wait([this, timer, item = std::move(item)](const boost::system::error_code& ec) mutable {
        {
            std::lock_guard<std::mutex> lock(timers_mutex_);
            timers_.erase(timer.get());
        }
        if (ec == net::error::operation_aborted) {
            parkOnShutdown(std::move(item));
            return;
        }
        attempt(std::move(item));
    });
}

void RetryWorker::parkOnShutdown(WorkItem item) {
    logger_->warn("Worker stopping before retry " + std::to_string(item.attempt_count + 1)
        + " of " + item.id + " (" + item.destination + "); dead-lettering it");
    item.last_error = "worker stopped before retry: " + item.last_error;
    park(item);
}

void RetryWorker::park(const WorkItem& item) {
    ExhaustedCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = exhausted_callback_;
    }
    if (!callback) {
        logger_->critical("Retries exhausted for " + item.id + " (" + item.destination
            + ") and no dead-letter sink is attached: " + item.last_error);
        --pending_;
        return;
    }
    try {
        callback(item);
    } catch (const std::exception& e) {
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        logger_->critical("Failed to dead-letter " + item.id + " (" + item.destination + "): " + e.what());
    }
    --pending_;
}
