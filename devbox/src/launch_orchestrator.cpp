#include "launch_orchestrator.hpp"
#include "backoff_policy.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <utility>

namespace {

// Lives for one launch() call only.
struct AttemptState {
    int attempt = 0; // retries performed
    int calls = 0;   // launch calls made
    std::chrono::milliseconds delay{0};
    Clock::time_point started;
    LaunchState state = LaunchState::Idle;
};

void transition(AttemptState& state, LaunchState next) {
    spdlog::debug("Launch state {} -> {} (attempt {})",
                  to_string(state.state), to_string(next), state.calls);
    state.state = next;
}

} // namespace

const char* to_string(LaunchState state) {
    switch (state) {
        case LaunchState::Idle: return "idle";
        case LaunchState::Attempting: return "attempting";
        case LaunchState::Backoff: return "backoff";
        case LaunchState::Succeeded: return "succeeded";
        case LaunchState::FatalFailed: return "fatal-failed";
        case LaunchState::RetriesExhausted: return "retries-exhausted";
        case LaunchState::Cancelled: return "cancelled";
    }
    return "unknown";
}

LaunchOrchestrator::LaunchOrchestrator(CloudApi& api, Clock& clock, EventSink& events,
                                       ErrorClassifier classifier)
    : api_(api), clock_(clock), events_(events), classifier_(std::move(classifier)) {
}

LaunchResult LaunchOrchestrator::launch(const LaunchRequest& request, const RetryConfig& config,
                                        const CancellationToken& cancel) {
    config.validate();

    AttemptState state;
    state.started = clock_.now();

    LaunchResult result;
    std::optional<ClassifiedError> last_error;

    auto fail = [&](FailureKind kind) {
        LaunchFailure failure;
        failure.kind = kind;
        failure.error = last_error;
        failure.attempts = state.calls;
        failure.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_.now() - state.started);
        result.failure = std::move(failure);
        result.attempts = state.calls;
        return result;
    };

    spdlog::info("Launching {} in {}", request.instance_type, request.region);

    while (true) {
        if (cancel.is_cancelled()) {
            transition(state, LaunchState::Cancelled);
            return fail(FailureKind::Cancelled);
        }

        transition(state, LaunchState::Attempting);
        ++state.calls;

        try {
            InstanceHandle instance = api_.launch(request);
            transition(state, LaunchState::Succeeded);
            spdlog::info("Launched {} after {} attempt(s)", instance.id, state.calls);
            result.instance = std::move(instance);
            result.attempts = state.calls;
            return result;
        } catch (const ApiException& e) {
            last_error = classifier_.classify(e.error());
        }

        if (!last_error->retryable) {
            transition(state, LaunchState::FatalFailed);
            spdlog::debug("Launch error {} ({}) is not retryable",
                          last_error->code, to_string(last_error->kind));
            return fail(FailureKind::FatalError);
        }

        if (state.attempt >= config.max_attempts) {
            transition(state, LaunchState::RetriesExhausted);
            spdlog::debug("Retry ceiling of {} reached", config.max_attempts);
            return fail(FailureKind::RetriesExhausted);
        }

        state.delay = BackoffPolicy::next_delay(state.attempt, config);
        transition(state, LaunchState::Backoff);

        RetryEvent event;
        event.attempt = state.calls;
        event.max_attempts = config.max_attempts;
        event.delay = state.delay;
        event.error = *last_error;
        events_.on_retry(event);

        if (!clock_.sleep_for(state.delay, cancel)) {
            transition(state, LaunchState::Cancelled);
            return fail(FailureKind::Cancelled);
        }
        ++state.attempt;
    }
}
