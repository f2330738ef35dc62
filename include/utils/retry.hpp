#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include <string>
#include <spdlog/spdlog.h>
#include "common/result.hpp"

namespace pbot {

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{1000};
};

using RetrySleeper = std::function<void(std::chrono::milliseconds)>;

inline void default_retry_sleep(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

/**
 * Run fn (returning Result<T>) until it succeeds, fails with a
 * non-retryable error, or max_attempts is reached. Delay before attempt
 * n+1 is base_delay * 2^(n-1). REJECTED, INVALID_DATA and CONFIGURATION
 * errors are returned immediately.
 */
template <typename F>
auto with_retry(F&& fn, const RetryPolicy& policy,
                const std::string& what = "request",
                const RetrySleeper& sleeper = default_retry_sleep) -> decltype(fn()) {
    int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 1; ; ++attempt) {
        auto result = fn();
        if (result.ok() || !result.error().is_retryable() || attempt >= attempts) {
            return result;
        }

        auto delay = policy.base_delay * (1LL << (attempt - 1));
        spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {}ms",
                     what, attempt, attempts, result.error().message, delay.count());
        sleeper(delay);
    }
}

} // namespace pbot
