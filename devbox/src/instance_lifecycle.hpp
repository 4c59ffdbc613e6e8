#pragma once
#include "clock.hpp"
#include "cloud_api.hpp"
#include "error_classifier.hpp"
#include "events.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Entry point for callers: launch with retry, then wait until the instance is
// reachable. A caller never sees an instance that is launched but not ready
// unless it asked for launch() alone.
class InstanceLifecycle {
public:
    InstanceLifecycle(CloudApi& api, Clock& clock, EventSink& events,
                      ErrorClassifier classifier = ErrorClassifier());

    LaunchOutcome bring_up(const LaunchRequest& request, const RetryConfig& retry_config,
                           const PollConfig& poll_config, const CancellationToken& cancel);

    // Launch phase only; the returned instance may still be booting.
    LaunchOutcome launch(const LaunchRequest& request, const RetryConfig& retry_config,
                         const CancellationToken& cancel);

    // Readiness phase only, for an instance launched earlier.
    LaunchOutcome wait_ready(const std::string& instance_id, const PollConfig& poll_config,
                             const CancellationToken& cancel);

    // Single status fetch. Throws ApiException.
    InstanceHandle describe(const std::string& instance_id);

    // Passthrough to the API, no retry. Throws ApiException.
    std::vector<InstanceHandle> terminate(const std::string& instance_id);

    // Account inventory, single calls. Throw ApiException.
    std::vector<InstanceHandle> list_instances();
    std::vector<InstanceTypeOffer> list_instance_types();

private:
    LaunchOutcome finish(LaunchOutcome outcome);

    CloudApi& api_;
    Clock& clock_;
    EventSink& events_;
    ErrorClassifier classifier_;
};
