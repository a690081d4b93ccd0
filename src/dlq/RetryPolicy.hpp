#ifndef RETRYPOLICY_HPP
#define RETRYPOLICY_HPP

#include <algorithm>
#include <chrono>
#include <stdexcept>

struct RetryPolicy {
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{60000};
    int max_attempts = 5;

    // Delay before the retry that follows the attempt-th failure (attempt >= 1):
    // base * 2^(attempt-1), capped at max_delay.
    std::chrono::milliseconds backoffFor(int attempt) const {
        if (attempt < 1) {
            throw std::invalid_argument("attempt must be >= 1");
        }
        std::chrono::milliseconds delay = base_delay;
        for (int i = 1; i < attempt && delay < max_delay; ++i) {
            delay *= 2;
        }
        return std::min(delay, max_delay);
    }

    bool exhausted(int attempt_count) const {
        return attempt_count >= max_attempts;
    }
};

#endif // RETRYPOLICY_HPP
