#include "readiness_poller.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>
#include <utility>

namespace {

// Later snapshots win, but keep what the earlier one knew if a field is missing.
InstanceHandle merge_snapshot(const InstanceHandle& previous, InstanceHandle latest) {
    if (latest.id.empty()) latest.id = previous.id;
    if (!latest.ip) latest.ip = previous.ip;
    if (latest.name.empty()) latest.name = previous.name;
    if (latest.region.empty()) latest.region = previous.region;
    if (latest.instance_type.empty()) latest.instance_type = previous.instance_type;
    return latest;
}

bool is_ready(const InstanceHandle& instance) {
    return instance.status == InstanceStatus::Active && instance.ip && !instance.ip->empty();
}

bool is_dead(const InstanceHandle& instance) {
    return instance.status == InstanceStatus::Terminated ||
           instance.status == InstanceStatus::Unhealthy;
}

} // namespace

ReadinessPoller::ReadinessPoller(CloudApi& api, Clock& clock, EventSink& events,
                                 ErrorClassifier classifier)
    : api_(api), clock_(clock), events_(events), classifier_(std::move(classifier)) {
}

PollResult ReadinessPoller::wait_ready(const InstanceHandle& handle, const PollConfig& config,
                                       const CancellationToken& cancel) {
    config.validate();

    const auto started = clock_.now();
    InstanceHandle current = handle;
    std::optional<ClassifiedError> last_error;
    PollResult result;

    auto elapsed = [&]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - started);
    };

    auto fail = [&](FailureKind kind) {
        LaunchFailure failure;
        failure.kind = kind;
        failure.error = last_error;
        failure.instance = current;
        failure.elapsed = elapsed();
        result.failure = std::move(failure);
        return result;
    };

    spdlog::info("Waiting up to {}s for {} to become active",
                 std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count(),
                 handle.id);

    while (true) {
        if (cancel.is_cancelled()) {
            return fail(FailureKind::Cancelled);
        }

        ++result.polls;
        try {
            current = merge_snapshot(current, api_.get_instance(handle.id));
            last_error.reset();
        } catch (const ApiException& e) {
            last_error = classifier_.classify(e.error());
            // A freshly launched instance may not be listed yet.
            if (last_error->kind != ErrorKind::NotFound && !last_error->retryable) {
                spdlog::error("Status check for {} failed: {}", handle.id, last_error->message);
                return fail(FailureKind::FatalError);
            }
            spdlog::debug("Status of {} not available yet: {}", handle.id, last_error->message);
        }

        PollEvent event;
        event.poll = result.polls;
        event.instance = current;
        event.elapsed = elapsed();
        events_.on_poll(event);

        if (is_ready(current)) {
            spdlog::debug("{} active at {} after {} poll(s)", current.id, *current.ip, result.polls);
            result.instance = current;
            return result;
        }

        if (is_dead(current)) {
            spdlog::error("Instance {} is {}", current.id, to_string(current.status));
            return fail(FailureKind::InstanceFailed);
        }

        auto spent = elapsed();
        if (spent >= config.timeout) {
            return fail(FailureKind::PollTimeout);
        }

        auto wait = std::min(config.poll_interval,
                             std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout - spent));
        if (!clock_.sleep_for(wait, cancel)) {
            return fail(FailureKind::Cancelled);
        }
    }
}
