#include "retry.hpp"
#include <random>

bool isTransientFailure(const ServiceError& error) {
    if (error.kind() == FailureKind::Timeout) {
        return true;
    }
    if (error.kind() == FailureKind::HttpStatus) {
        int status = error.status();
        return status == 429 || status == 502 || status == 503 || status == 504;
    }
    return false;
}

bool isUnavailableFailure(const ServiceError& error) {
    return isTransientFailure(error) &&
           !(error.kind() == FailureKind::HttpStatus && error.status() == 429);
}

std::string describeFailure(const ServiceError& error) {
    switch (error.kind()) {
        case FailureKind::Timeout:
            return std::string("timeout (") + error.what() + ")";
        case FailureKind::HttpStatus:
            return "HTTP " + std::to_string(error.status()) + " (" + error.what() + ")";
        case FailureKind::Transport:
            break;
    }
    return std::string("transport error (") + error.what() + ")";
}

std::chrono::milliseconds backoffSleepTime(std::chrono::milliseconds delay,
                                           std::chrono::milliseconds max_delay) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dis(0.1, 0.3);

    auto jitter = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(delay.count()) * dis(gen)));
    if (delay >= max_delay || jitter >= max_delay - delay) {
        return max_delay;
    }
    return delay + jitter;
}
