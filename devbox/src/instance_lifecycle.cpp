#include "instance_lifecycle.hpp"
#include "launch_orchestrator.hpp"
#include "readiness_poller.hpp"
#include <spdlog/spdlog.h>
#include <utility>

InstanceLifecycle::InstanceLifecycle(CloudApi& api, Clock& clock, EventSink& events,
                                     ErrorClassifier classifier)
    : api_(api), clock_(clock), events_(events), classifier_(std::move(classifier)) {
}

LaunchOutcome InstanceLifecycle::bring_up(const LaunchRequest& request,
                                          const RetryConfig& retry_config,
                                          const PollConfig& poll_config,
                                          const CancellationToken& cancel) {
    poll_config.validate();

    LaunchOrchestrator orchestrator(api_, clock_, events_, classifier_);
    LaunchResult launched = orchestrator.launch(request, retry_config, cancel);

    LaunchOutcome outcome;
    if (!launched.ok()) {
        outcome.failure = std::move(launched.failure);
        return finish(std::move(outcome));
    }

    ReadinessPoller poller(api_, clock_, events_, classifier_);
    PollResult polled = poller.wait_ready(*launched.instance, poll_config, cancel);

    if (!polled.ok()) {
        outcome.failure = std::move(polled.failure);
        outcome.failure->attempts = launched.attempts;
        return finish(std::move(outcome));
    }

    outcome.instance = std::move(polled.instance);
    return finish(std::move(outcome));
}

LaunchOutcome InstanceLifecycle::launch(const LaunchRequest& request,
                                        const RetryConfig& retry_config,
                                        const CancellationToken& cancel) {
    LaunchOrchestrator orchestrator(api_, clock_, events_, classifier_);
    LaunchResult launched = orchestrator.launch(request, retry_config, cancel);

    LaunchOutcome outcome;
    outcome.instance = std::move(launched.instance);
    outcome.failure = std::move(launched.failure);
    return finish(std::move(outcome));
}

LaunchOutcome InstanceLifecycle::wait_ready(const std::string& instance_id,
                                            const PollConfig& poll_config,
                                            const CancellationToken& cancel) {
    InstanceHandle handle;
    handle.id = instance_id;

    ReadinessPoller poller(api_, clock_, events_, classifier_);
    PollResult polled = poller.wait_ready(handle, poll_config, cancel);

    LaunchOutcome outcome;
    outcome.instance = std::move(polled.instance);
    outcome.failure = std::move(polled.failure);
    return finish(std::move(outcome));
}

InstanceHandle InstanceLifecycle::describe(const std::string& instance_id) {
    return api_.get_instance(instance_id);
}

std::vector<InstanceHandle> InstanceLifecycle::terminate(const std::string& instance_id) {
    spdlog::info("Terminating {}", instance_id);
    return api_.terminate({instance_id});
}

std::vector<InstanceHandle> InstanceLifecycle::list_instances() {
    return api_.list_instances();
}

std::vector<InstanceTypeOffer> InstanceLifecycle::list_instance_types() {
    return api_.list_instance_types();
}

LaunchOutcome InstanceLifecycle::finish(LaunchOutcome outcome) {
    events_.on_outcome(outcome);
    return outcome;
}
