#pragma once
#include "clock.hpp"
#include "cloud_api.hpp"
#include "error_classifier.hpp"
#include "events.hpp"
#include "types.hpp"

enum class LaunchState {
    Idle,
    Attempting,
    Backoff,
    Succeeded,
    FatalFailed,
    RetriesExhausted,
    Cancelled
};

const char* to_string(LaunchState state);

// Repeats a launch while the API reports a retryable error, sleeping between
// attempts according to BackoffPolicy. Holds no state between calls.
class LaunchOrchestrator {
public:
    LaunchOrchestrator(CloudApi& api, Clock& clock, EventSink& events,
                       ErrorClassifier classifier = ErrorClassifier());

    LaunchResult launch(const LaunchRequest& request, const RetryConfig& config,
                        const CancellationToken& cancel);

private:
    CloudApi& api_;
    Clock& clock_;
    EventSink& events_;
    ErrorClassifier classifier_;
};
