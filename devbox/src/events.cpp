#include "events.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

void LoggingEventSink::on_retry(const RetryEvent& event) {
    spdlog::warn("{} (attempt {}/{}), retrying in {}",
                 event.error.message, event.attempt, event.max_attempts + 1,
                 util::format_seconds(event.delay));
}

void LoggingEventSink::on_poll(const PollEvent& event) {
    spdlog::info("Waiting for {}: {} after {}",
                 event.instance.id, to_string(event.instance.status),
                 util::format_seconds(event.elapsed));
}

void LoggingEventSink::on_outcome(const LaunchOutcome& outcome) {
    if (outcome.ok()) {
        const auto& instance = *outcome.instance;
        spdlog::info("Ready: {} -> {} ({})", instance.id, instance.ip.value_or("-"),
                     to_string(instance.status));
        return;
    }

    const auto& failure = *outcome.failure;
    spdlog::error("{}", failure.describe());
    auto hint = failure_hint(failure);
    if (!hint.empty()) {
        spdlog::error("Hint: {}", hint);
    }
}

std::string failure_hint(const LaunchFailure& failure) {
    if (failure.error && !failure.error->suggestion.empty()) {
        return failure.error->suggestion;
    }

    switch (failure.kind) {
        case FailureKind::RetriesExhausted:
            return "No capacity for this instance type in this region. Run 'devbox list "
                   "resource=instance-types available_only=true' to see where capacity is, "
                   "or raise retry_max_attempts.";
        case FailureKind::PollTimeout:
            return failure.instance
                ? fmt::format("The instance is still provisioning. Run 'devbox wait instance_id={0}' "
                              "or terminate it with 'devbox down instance_id={0}'.",
                              failure.instance->id)
                : std::string();
        case FailureKind::InstanceFailed:
            return failure.instance
                ? fmt::format("Terminate it with 'devbox down instance_id={}' and launch again.",
                              failure.instance->id)
                : std::string();
        case FailureKind::Cancelled:
            return failure.instance
                ? fmt::format("Instance {} was launched and is still running.", failure.instance->id)
                : std::string();
        case FailureKind::FatalError:
            break;
    }

    if (!failure.error) {
        return {};
    }

    switch (failure.error->kind) {
        case ErrorKind::Auth:
            return "Check LAMBDA_API_KEY and that the account is active.";
        case ErrorKind::Quota:
            return "Account quota reached. Terminate unused instances or request a higher quota.";
        case ErrorKind::Validation:
            return "Check region, instance_type, ssh_key_name and filesystem_name.";
        case ErrorKind::NotFound:
            return "A referenced resource does not exist. Check the names and ids used.";
        case ErrorKind::Capacity:
        case ErrorKind::Unknown:
            break;
    }
    return {};
}
