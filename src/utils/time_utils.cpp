#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <thread>
#include <algorithm>

namespace pbot {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(int64_t epoch_ms) {
    auto tp = WallClock(std::chrono::milliseconds(epoch_ms));
    return to_iso8601(tp);
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Not an ISO 8601 timestamp: " + s);
    }

    auto time_t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(time_t);

    // Parse milliseconds if present
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        std::string ms_str = s.substr(dot_pos + 1, 3);
        while (!ms_str.empty() && !std::isdigit(static_cast<unsigned char>(ms_str.back()))) {
            ms_str.pop_back();
        }
        if (!ms_str.empty()) {
            while (ms_str.size() < 3) ms_str += '0';
            tp += std::chrono::milliseconds(std::stoi(ms_str));
        }
    }

    return tp;
}

int64_t iso8601_to_epoch_ms(const std::string& s) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        from_iso8601(s).time_since_epoch()).count();
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string format_span_ms(int64_t ms) {
    if (ms < 0) return "past";

    int64_t minutes = ms / 60000;
    int64_t hours = minutes / 60;
    int64_t days = hours / 24;

    std::ostringstream ss;
    if (days > 0) {
        ss << days << "d";
        if (hours % 24 > 0) ss << " " << hours % 24 << "h";
    } else if (hours > 0) {
        ss << hours << "h";
        if (minutes % 60 > 0) ss << " " << minutes % 60 << "m";
    } else {
        ss << minutes << "m";
    }
    return ss.str();
}

// RateLimiter implementation

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window,
                         Clock clock, Sleeper sleeper)
    : max_requests_(std::max(1, max_requests))
    , window_(window)
    , clock_(clock ? std::move(clock) : Clock([] { return now(); }))
    , sleeper_(sleeper ? std::move(sleeper) : Sleeper([](Duration d) { std::this_thread::sleep_for(d); }))
{
}

void RateLimiter::prune(Timestamp now_tp) const {
    while (!request_times_.empty() && now_tp - request_times_.front() >= window_) {
        request_times_.pop_front();
    }
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now_tp = clock_();
    prune(now_tp);

    if (static_cast<int>(request_times_.size()) >= max_requests_) {
        return false;
    }

    request_times_.push_back(now_tp);
    return true;
}

void RateLimiter::acquire() {
    while (true) {
        Duration wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now_tp = clock_();
            prune(now_tp);

            if (static_cast<int>(request_times_.size()) < max_requests_) {
                request_times_.push_back(now_tp);
                return;
            }

            // Sleep until the oldest request leaves the window, plus a small margin
            wait = std::chrono::duration_cast<Duration>(
                window_ - (now_tp - request_times_.front()) + std::chrono::milliseconds(100));
        }
        sleeper_(wait);
    }
}

int RateLimiter::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(clock_());
    return std::max(0, max_requests_ - static_cast<int>(request_times_.size()));
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    request_times_.clear();
}

} // namespace time_utils
} // namespace pbot
