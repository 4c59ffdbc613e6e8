/**
 * @file test_readiness_poller.cpp
 * @brief Tests for readiness_poller.hpp
 */

#include "fakes.hpp"
#include "readiness_poller.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

InstanceHandle launched(const std::string& id) {
    return make_instance(id, InstanceStatus::Booting);
}

} // namespace

TEST_CASE("ReadinessPoller returns immediately when already active", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Active, "10.0.0.5");

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(60)), cancel);

    REQUIRE(result.ok());
    REQUIRE(result.instance->id == "i-1");
    REQUIRE(result.instance->ip == std::optional<std::string>("10.0.0.5"));
    REQUIRE(result.polls == 1);
    REQUIRE(clock.sleeps.empty());
    REQUIRE(api.requested_ids == std::vector<std::string>{"i-1"});
}

TEST_CASE("ReadinessPoller polls at a fixed interval", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Booting);
    api.queue_status(InstanceStatus::Booting);
    api.queue_status(InstanceStatus::Active, "10.0.0.5");

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(300)), cancel);

    REQUIRE(result.ok());
    REQUIRE(result.polls == 3);
    REQUIRE(clock.sleeps == std::vector<milliseconds>{seconds(10), seconds(10)});
    REQUIRE(events.polls.size() == 3);
    REQUIRE(events.polls[0].instance.status == InstanceStatus::Booting);
    REQUIRE(events.polls[2].instance.status == InstanceStatus::Active);
    REQUIRE(events.polls[2].elapsed == seconds(20));
}

TEST_CASE("ReadinessPoller waits for an IP on an active instance", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Active);
    api.queue_status(InstanceStatus::Active, "10.0.0.7");

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(5), seconds(60)), cancel);

    REQUIRE(result.ok());
    REQUIRE(result.polls == 2);
    REQUIRE(*result.instance->ip == "10.0.0.7");
}

TEST_CASE("ReadinessPoller times out and keeps the instance id", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Booting);

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-slow"), make_poll_config(seconds(10), seconds(25)), cancel);

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure->kind == FailureKind::PollTimeout);
    REQUIRE(result.failure->instance->id == "i-slow");
    REQUIRE(result.failure->instance->status == InstanceStatus::Booting);
    REQUIRE_FALSE(result.failure->error.has_value());
    REQUIRE(result.failure->elapsed == seconds(25));
    // The last wait is shortened so the timeout is not overshot.
    REQUIRE(clock.sleeps == std::vector<milliseconds>{seconds(10), seconds(10), seconds(5)});
    REQUIRE(result.polls == 4);
}

TEST_CASE("ReadinessPoller fails fast on a terminated instance", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Booting);
    api.queue_status(InstanceStatus::Terminated);

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(600)), cancel);

    REQUIRE(result.failure->kind == FailureKind::InstanceFailed);
    REQUIRE(result.failure->instance->status == InstanceStatus::Terminated);
    REQUIRE(result.polls == 2);
    REQUIRE(clock.sleeps.size() == 1);
    REQUIRE(result.failure->elapsed == seconds(10));
}

TEST_CASE("ReadinessPoller fails fast on an unhealthy instance", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Unhealthy);

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(600)), cancel);

    REQUIRE(result.failure->kind == FailureKind::InstanceFailed);
    REQUIRE(clock.sleeps.empty());
}

TEST_CASE("ReadinessPoller tolerates an instance that is not listed yet", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status_error("global/object-does-not-exist");
    api.queue_status(InstanceStatus::Active, "10.0.0.9");

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(60)), cancel);

    REQUIRE(result.ok());
    REQUIRE(result.polls == 2);
}

TEST_CASE("ReadinessPoller stops on a fatal status error", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Booting);
    api.queue_status_error("global/invalid-api-key");

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(60)), cancel);

    REQUIRE(result.failure->kind == FailureKind::FatalError);
    REQUIRE(result.failure->error->kind == ErrorKind::Auth);
    REQUIRE(result.failure->instance->id == "i-1");
    REQUIRE(api.status_calls == 2);
}

TEST_CASE("ReadinessPoller cancelled while waiting", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    api.queue_status(InstanceStatus::Booting);
    clock.on_sleep = [&](size_t) { cancel.cancel(); };

    ReadinessPoller poller(api, clock, events);
    auto result = poller.wait_ready(launched("i-1"), make_poll_config(seconds(10), seconds(600)), cancel);

    REQUIRE(result.failure->kind == FailureKind::Cancelled);
    REQUIRE(result.failure->instance->id == "i-1");
    REQUIRE(api.status_calls == 1);
}

TEST_CASE("ReadinessPoller rejects an invalid poll config", "[poller]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;

    ReadinessPoller poller(api, clock, events);
    REQUIRE_THROWS_AS(poller.wait_ready(launched("i-1"), make_poll_config(seconds(0), seconds(60)), cancel),
                      std::invalid_argument);
    REQUIRE(api.status_calls == 0);
}
