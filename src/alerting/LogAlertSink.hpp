#pragma once

#include <memory>

#include "../interfaces/IAlertSink.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Default sink: one JSON line per alert on the error stream, plus a counter.
class LogAlertSink : public IAlertSink {
public:
    LogAlertSink(std::shared_ptr<ILogger> logger, std::shared_ptr<IStatsDClient> statsd_client);
    ~LogAlertSink() override = default;

    void raise(const Alert& alert) override;

private:
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};
