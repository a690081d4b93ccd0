#ifndef RETRYWORKER_HPP
#define RETRYWORKER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "RetryPolicy.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IMessageTransport.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/DeadLetterMessage.hpp"

namespace net = boost::asio;

// In-process transport: published items are dispatched to the handler
// registered for their destination on a pool of worker threads. A handler
// signals failure by throwing; the item is re-armed on a timer with
// exponential backoff until max_attempts, then handed to the exhausted
// callback.
class RetryWorker : public IMessageTransport {
public:
    using Handler = std::function<void(const WorkItem&)>;
    using ExhaustedCallback = std::function<void(const WorkItem&)>;

    RetryWorker(RetryPolicy policy,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IStatsDClient> statsd_client,
                std::shared_ptr<IClock> clock);
    ~RetryWorker() override;

    RetryWorker(const RetryWorker&) = delete;
    RetryWorker& operator=(const RetryWorker&) = delete;

    void registerHandler(const std::string& destination, Handler handler);
    void onExhausted(ExhaustedCallback callback);

    // New work item with attempt_count 0. Throws std::runtime_error once stopped.
    void publish(const std::string& destination, const nlohmann::json& payload) override;
    void submit(WorkItem item);

    void start(size_t thread_count);
    // Cancels pending retries and joins the pool. Items waiting on a timer are
    // handed to the exhausted callback instead of being retried.
    void stop();

    // Items accepted and not yet delivered or parked.
    size_t pending() const { return pending_.load(); }
    const RetryPolicy& policy() const { return policy_; }

private:
    void dispatch(WorkItem item);
    void attempt(WorkItem item);
    void onAttemptFailed(WorkItem item, const std::string& error);
    void scheduleRetry(WorkItem item, std::chrono::milliseconds delay);
    void parkOnShutdown(WorkItem item);
    void park(const WorkItem& item);

    RetryPolicy policy_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;

    net::io_context ioc_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_guard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> stopped_{false};
    std::atomic<size_t> pending_{0};

    std::mutex handlers_mutex_;
    std::unordered_map<std::string, Handler> handlers_;
    ExhaustedCallback exhausted_callback_;

    std::mutex timers_mutex_;
    std::unordered_map<net::steady_timer*, std::shared_ptr<net::steady_timer>> timers_;
};

#endif // RETRYWORKER_HPP
