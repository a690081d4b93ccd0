#pragma once

#include <chrono>

class IClock {
public:
    virtual ~IClock() = default;
    // Monotonic time for timeouts and expiry.
    virtual std::chrono::steady_clock::time_point steadyNow() = 0;
    // Wall time for audit records, cooldowns and daily windows.
    virtual std::chrono::system_clock::time_point systemNow() = 0;
};
