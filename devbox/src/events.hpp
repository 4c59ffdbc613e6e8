#pragma once
#include "types.hpp"
#include <chrono>
#include <string>

struct RetryEvent {
    int attempt = 0;        // launch calls made so far
    int max_attempts = 0;   // retry ceiling from RetryConfig
    std::chrono::milliseconds delay{0};
    ClassifiedError error;
};

struct PollEvent {
    int poll = 0;
    InstanceHandle instance;
    std::chrono::milliseconds elapsed{0};
};

// One-way channel for progress of a launch. The engine never formats output.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_retry(const RetryEvent& event) = 0;
    virtual void on_poll(const PollEvent& event) = 0;
    virtual void on_outcome(const LaunchOutcome& outcome) = 0;
};

class LoggingEventSink : public EventSink {
public:
    void on_retry(const RetryEvent& event) override;
    void on_poll(const PollEvent& event) override;
    void on_outcome(const LaunchOutcome& outcome) override;
};

// What the user can do about a failure of this kind.
std::string failure_hint(const LaunchFailure& failure);
