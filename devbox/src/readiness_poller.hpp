#pragma once
#include "clock.hpp"
#include "cloud_api.hpp"
#include "error_classifier.hpp"
#include "events.hpp"
#include "types.hpp"

// Polls a launched instance at a fixed interval until it is Active with an IP,
// reaches Terminated or Unhealthy, or the timeout runs out.
class ReadinessPoller {
public:
    ReadinessPoller(CloudApi& api, Clock& clock, EventSink& events,
                    ErrorClassifier classifier = ErrorClassifier());

    PollResult wait_ready(const InstanceHandle& handle, const PollConfig& config,
                          const CancellationToken& cancel);

private:
    CloudApi& api_;
    Clock& clock_;
    EventSink& events_;
    ErrorClassifier classifier_;
};
