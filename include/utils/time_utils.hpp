#pragma once

#include <string>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include "common/types.hpp"

namespace pbot {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse ISO 8601 string to timestamp.
 */
WallClock from_iso8601(const std::string& s);
int64_t iso8601_to_epoch_ms(const std::string& s);

/**
 * Get current timestamp as ISO 8601.
 */
std::string now_iso8601();

/**
 * Get current epoch milliseconds.
 */
int64_t epoch_ms();

/**
 * Format a millisecond span for display ("3d 4h", "45m").
 */
std::string format_span_ms(int64_t ms);

/**
 * Rolling-window request limiter for an external API.
 *
 * Keeps the timestamps of the requests made in the last window; acquire()
 * sleeps the caller until the oldest one ages out when the window is full.
 * Owned by whoever wires the clients and passed to every call site, so
 * each API (and each test) gets its own instance.
 */
class RateLimiter {
public:
    using Clock = std::function<Timestamp()>;
    using Sleeper = std::function<void(Duration)>;

    RateLimiter(int max_requests, std::chrono::milliseconds window,
                Clock clock = {}, Sleeper sleeper = {});

    // Returns true if request is allowed, false if rate limited
    bool try_acquire();

    // Wait until request is allowed
    void acquire();

    // Requests still available in the current window
    int remaining() const;

    void reset();

private:
    int max_requests_;
    std::chrono::milliseconds window_;
    Clock clock_;
    Sleeper sleeper_;
    mutable std::deque<Timestamp> request_times_;
    mutable std::mutex mutex_;

    // Drop timestamps older than the window; caller holds mutex_
    void prune(Timestamp now_tp) const;
};

} // namespace time_utils
} // namespace pbot
