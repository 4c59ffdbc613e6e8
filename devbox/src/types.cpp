#include "types.hpp"
#include "util.hpp"
#include <cmath>
#include <fmt/format.h>
#include <utility>

namespace {

std::string api_error_what(const ApiError& error) {
    std::string what = error.code.empty() ? "api error" : error.code;
    if (error.http_status != 0) {
        what += fmt::format(" (HTTP {})", error.http_status);
    }
    if (!error.message.empty()) {
        what += ": " + error.message;
    }
    return what;
}

} // namespace

ApiException::ApiException(ApiError error)
    : std::runtime_error(api_error_what(error)), error_(std::move(error)) {
}

void RetryConfig::validate() const {
    if (max_attempts < 0) {
        throw std::invalid_argument("max_attempts must be >= 0");
    }
    if (initial_delay.count() < 0) {
        throw std::invalid_argument("initial_delay must not be negative");
    }
    if (initial_delay > max_delay) {
        throw std::invalid_argument("initial_delay must not exceed max_delay");
    }
    // Written so that NaN fails both checks.
    if (!std::isfinite(multiplier) || !(multiplier >= 1.0)) {
        throw std::invalid_argument("multiplier must be a finite number >= 1.0");
    }
    if (!(jitter_factor >= 0.0 && jitter_factor < 1.0)) {
        throw std::invalid_argument("jitter_factor must be in [0, 1)");
    }
}

void PollConfig::validate() const {
    if (poll_interval.count() <= 0) {
        throw std::invalid_argument("poll_interval must be positive");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
}

const char* to_string(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::Booting: return "booting";
        case InstanceStatus::Active: return "active";
        case InstanceStatus::Unhealthy: return "unhealthy";
        case InstanceStatus::Terminated: return "terminated";
        case InstanceStatus::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Capacity: return "capacity";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Quota: return "quota";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::RetriesExhausted: return "retries-exhausted";
        case FailureKind::FatalError: return "fatal-error";
        case FailureKind::PollTimeout: return "poll-timeout";
        case FailureKind::InstanceFailed: return "instance-failed";
        case FailureKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string LaunchFailure::describe() const {
    std::string text;
    switch (kind) {
        case FailureKind::RetriesExhausted:
            text = fmt::format("no capacity after {} launch attempts", attempts);
            break;
        case FailureKind::FatalError:
            text = "launch failed";
            break;
        case FailureKind::PollTimeout:
            text = fmt::format("instance not ready within {}", util::format_seconds(elapsed));
            break;
        case FailureKind::InstanceFailed:
            text = "instance entered a state it cannot recover from";
            break;
        case FailureKind::Cancelled:
            text = "cancelled";
            break;
    }

    if (error) {
        text += fmt::format(" [{}]", to_string(error->kind));
        if (!error->message.empty()) {
            text += fmt::format(": {}", error->message);
        }
    }
    if (instance) {
        text += fmt::format(" (instance {}, {})", instance->id, to_string(instance->status));
    }
    return text;
}
