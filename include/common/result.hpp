#pragma once

#include <string>
#include <variant>
#include <utility>
#include <stdexcept>

namespace pbot {

/**
 * Failure classes for calls to external collaborators.
 */
enum class ErrorKind {
    TRANSIENT,      // Network failure, timeout, 5xx, 429: safe to retry
    REJECTED,       // 4xx / venue rejection: never retried
    INVALID_DATA,   // Response violated an invariant (bad JSON, prob outside [0,1])
    CONFIGURATION   // Missing credentials or settings
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::TRANSIENT: return "TRANSIENT";
        case ErrorKind::REJECTED: return "REJECTED";
        case ErrorKind::INVALID_DATA: return "INVALID_DATA";
        case ErrorKind::CONFIGURATION: return "CONFIGURATION";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorKind kind{ErrorKind::TRANSIENT};
    std::string message;
    long http_status{0};

    bool is_retryable() const { return kind == ErrorKind::TRANSIENT; }

    static Error transient(std::string msg, long status = 0) {
        return Error{ErrorKind::TRANSIENT, std::move(msg), status};
    }
    static Error rejected(std::string msg, long status = 0) {
        return Error{ErrorKind::REJECTED, std::move(msg), status};
    }
    static Error invalid_data(std::string msg) {
        return Error{ErrorKind::INVALID_DATA, std::move(msg), 0};
    }
    static Error configuration(std::string msg) {
        return Error{ErrorKind::CONFIGURATION, std::move(msg), 0};
    }

    // Classify an HTTP status code returned by a venue
    static Error from_http_status(long status, const std::string& context) {
        std::string msg = context + ": HTTP " + std::to_string(status);
        if (status == 429 || status >= 500) {
            return transient(std::move(msg), status);
        }
        return rejected(std::move(msg), status);
    }
};

/**
 * Value-or-error return for collaborator calls. Call sites decide whether
 * to propagate, degrade, or record the failure.
 */
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
        return std::get<T>(data_);
    }
    T& value() & {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
        return std::get<T>(data_);
    }
    T&& value() && {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

    template <typename U>
    T value_or(U&& fallback) const {
        return ok() ? std::get<T>(data_) : static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, Error> data_;
};

} // namespace pbot
