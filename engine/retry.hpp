#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <iostream>
#include <thread>
#include <algorithm>

enum class FailureKind {
    Timeout,     // deadline exceeded
    HttpStatus,  // service answered with an HTTP-style error status
    Transport    // connection could not be established or was dropped
};

// Failure of one outbound call to a geocoding or routing service
class ServiceError : public std::runtime_error {
private:
    FailureKind failure_kind;
    int http_status;

public:
    ServiceError(FailureKind kind, int status, const std::string& message)
        : std::runtime_error(message), failure_kind(kind), http_status(status) {}

    FailureKind kind() const { return failure_kind; }
    int status() const { return http_status; }
};

// Timeouts, rate limiting (429) and transient server unavailability (502/503/504)
bool isTransientFailure(const ServiceError& error);

// Timeouts and 502/503/504 only; rate limiting is terminal
bool isUnavailableFailure(const ServiceError& error);

std::string describeFailure(const ServiceError& error);

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    std::function<bool(const ServiceError&)> is_retryable = isTransientFailure;
    std::function<void(std::chrono::milliseconds)> sleep = [](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
    };
};

// min(delay + jitter, max_delay), jitter drawn uniformly from [10%, 30%] of delay
std::chrono::milliseconds backoffSleepTime(std::chrono::milliseconds delay,
                                           std::chrono::milliseconds max_delay);

// Calls fn until it succeeds, throws something other than a retryable
// ServiceError, or max_attempts calls have been made. The last failure is
// rethrown to the caller.
template <typename Fn>
auto withRetry(const RetryPolicy& policy, const std::string& operation, Fn&& fn) -> decltype(fn()) {
    const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    std::chrono::milliseconds delay = std::min(policy.initial_delay, policy.max_delay);

    for (int attempt = 1; ; ++attempt) {
        try {
            return fn();
        } catch (const ServiceError& e) {
            if (!policy.is_retryable || !policy.is_retryable(e)) {
                throw;
            }
            if (attempt >= attempts) {
                std::cerr << "[ERROR] All " << attempts << " attempts failed for "
                          << operation << ": " << describeFailure(e) << "\n";
                throw;
            }

            auto sleep_time = backoffSleepTime(delay, policy.max_delay);
            std::cerr << "[WARNING] " << describeFailure(e) << " for " << operation
                      << ", retry " << attempt << "/" << (attempts - 1)
                      << " after " << sleep_time.count() << " ms\n";
            policy.sleep(sleep_time);
            delay = delay > policy.max_delay / 2 ? policy.max_delay : delay * 2;
        }
    }
}
