#pragma once
/**
 * @file fakes.hpp
 * @brief Scripted CloudApi, manual Clock and recording EventSink for tests.
 */

#include "clock.hpp"
#include "cloud_api.hpp"
#include "events.hpp"
#include "types.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

inline ApiError make_api_error(const std::string& code, const std::string& message = "") {
    ApiError error;
    error.code = code;
    error.message = message.empty() ? code : message;
    error.http_status = 400;
    return error;
}

inline InstanceHandle make_instance(const std::string& id, InstanceStatus status,
                                    std::optional<std::string> ip = std::nullopt) {
    InstanceHandle instance;
    instance.id = id;
    instance.status = status;
    instance.ip = std::move(ip);
    return instance;
}

// Each call consumes the next scripted step; the last step repeats forever.
class FakeCloudApi : public CloudApi {
public:
    using Step = std::function<InstanceHandle()>;

    void queue_launch(const std::string& id) {
        launch_steps_.push_back([id] { return make_instance(id, InstanceStatus::Booting); });
    }

    void queue_launch_error(const std::string& code, int times = 1) {
        for (int i = 0; i < times; ++i) {
            launch_steps_.push_back([code]() -> InstanceHandle { throw ApiException(make_api_error(code)); });
        }
    }

    void queue_status(InstanceStatus status, std::optional<std::string> ip = std::nullopt) {
        status_steps_.push_back([status, ip] { return make_instance("", status, ip); });
    }

    void queue_status_error(const std::string& code) {
        status_steps_.push_back([code]() -> InstanceHandle { throw ApiException(make_api_error(code)); });
    }

    void fail_terminate_with(const std::string& code) { terminate_error_ = code; }

    InstanceHandle launch(const LaunchRequest& request) override {
        ++launch_calls;
        last_request = request;
        return next(launch_steps_, "launch");
    }

    InstanceHandle get_instance(const std::string& instance_id) override {
        ++status_calls;
        requested_ids.push_back(instance_id);
        auto instance = next(status_steps_, "get_instance");
        if (instance.id.empty()) {
            instance.id = instance_id;
        }
        return instance;
    }

    std::vector<InstanceHandle> terminate(const std::vector<std::string>& instance_ids) override {
        ++terminate_calls;
        if (terminate_error_) {
            throw ApiException(make_api_error(*terminate_error_));
        }
        std::vector<InstanceHandle> terminated;
        for (const auto& id : instance_ids) {
            terminated_ids.push_back(id);
            terminated.push_back(make_instance(id, InstanceStatus::Terminated));
        }
        return terminated;
    }

    std::vector<InstanceHandle> list_instances() override {
        ++list_calls;
        if (list_error_) {
            throw ApiException(make_api_error(*list_error_));
        }
        return instances;
    }

    std::vector<InstanceTypeOffer> list_instance_types() override {
        ++list_calls;
        if (list_error_) {
            throw ApiException(make_api_error(*list_error_));
        }
        return instance_types;
    }

    void fail_list_with(const std::string& code) { list_error_ = code; }

    int launch_calls = 0;
    int status_calls = 0;
    int terminate_calls = 0;
    std::optional<LaunchRequest> last_request;
    std::vector<std::string> requested_ids;
    std::vector<std::string> terminated_ids;
    int list_calls = 0;
    std::vector<InstanceHandle> instances;
    std::vector<InstanceTypeOffer> instance_types;

private:
    static InstanceHandle next(std::deque<Step>& steps, const char* what) {
        if (steps.empty()) {
            throw std::logic_error(std::string("no scripted response for ") + what);
        }
        Step step = steps.front();
        if (steps.size() > 1) {
            steps.pop_front();
        }
        return step();
    }

    std::deque<Step> launch_steps_;
    std::deque<Step> status_steps_;
    std::optional<std::string> terminate_error_;
    std::optional<std::string> list_error_;
};

// Time only moves when sleep_for() is called.
class FakeClock : public Clock {
public:
    time_point now() const override { return now_; }

    bool sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) override {
        sleeps.push_back(duration);
        if (on_sleep) {
            on_sleep(sleeps.size());
        }
        if (token.is_cancelled()) {
            return false;
        }
        now_ += duration;
        return true;
    }

    std::chrono::milliseconds total_slept() const {
        std::chrono::milliseconds total{0};
        for (auto d : sleeps) total += d;
        return total;
    }

    std::vector<std::chrono::milliseconds> sleeps;
    std::function<void(size_t)> on_sleep;

private:
    time_point now_{};
};

class RecordingEventSink : public EventSink {
public:
    void on_retry(const RetryEvent& event) override { retries.push_back(event); }
    void on_poll(const PollEvent& event) override { polls.push_back(event); }
    void on_outcome(const LaunchOutcome& outcome) override { outcomes.push_back(outcome); }

    std::vector<RetryEvent> retries;
    std::vector<PollEvent> polls;
    std::vector<LaunchOutcome> outcomes;
};

inline LaunchRequest make_request() {
    LaunchRequest request;
    request.region = "us-east-1";
    request.instance_type = "gpu_1x_a100";
    request.ssh_key_name = "laptop";
    return request;
}

inline RetryConfig make_retry_config(int max_attempts) {
    RetryConfig config;
    config.max_attempts = max_attempts;
    config.initial_delay = std::chrono::seconds(5);
    config.max_delay = std::chrono::seconds(20);
    config.multiplier = 1.5;
    return config;
}

inline PollConfig make_poll_config(std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
    PollConfig config;
    config.poll_interval = interval;
    config.timeout = timeout;
    return config;
}
