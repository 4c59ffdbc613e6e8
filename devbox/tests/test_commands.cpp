/**
 * @file test_commands.cpp
 * @brief Tests for commands.hpp
 */

#include "commands.hpp"
#include "fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

Config command_config() {
    Config config;
    config.api_key = "secret";
    config.region = "us-east-1";
    config.instance_type = "gpu_1x_a100";
    config.ssh_key_name = "laptop";
    config.instance_id = "i-1";
    config.retry_max_attempts = 2;
    config.poll_interval_seconds = 1;
    config.wait_timeout_seconds = 5;
    return config;
}

} // namespace

TEST_CASE("ssh_command", "[commands]") {
    REQUIRE(ssh_command("192.0.2.1", "ubuntu") == "ssh ubuntu@192.0.2.1");
}

TEST_CASE("run_up exit codes", "[commands]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    InstanceLifecycle lifecycle(api, clock, events);

    SECTION("ready instance") {
        api.queue_launch("i-1");
        api.queue_status(InstanceStatus::Active, "192.0.2.1");
        REQUIRE(run_command("up", command_config(), lifecycle, cancel) == kExitOk);
    }

    SECTION("launch only") {
        api.queue_launch("i-1");
        auto config = command_config();
        config.wait_after_launch = false;
        REQUIRE(run_up(config, lifecycle, cancel) == kExitOk);
        REQUIRE(api.status_calls == 0);
    }

    SECTION("fatal error") {
        api.queue_launch_error("global/quota-exceeded");
        REQUIRE(run_up(command_config(), lifecycle, cancel) == kExitFailure);
    }

    SECTION("cancelled") {
        api.queue_launch("i-1");
        cancel.cancel();
        REQUIRE(run_up(command_config(), lifecycle, cancel) == kExitCancelled);
    }
}

TEST_CASE("run_wait exit codes", "[commands]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    InstanceLifecycle lifecycle(api, clock, events);

    api.queue_status(InstanceStatus::Booting);
    REQUIRE(run_wait(command_config(), lifecycle, cancel) == kExitFailure);
    REQUIRE(api.requested_ids.front() == "i-1");
}

TEST_CASE("run_down and run_ssh", "[commands]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    CancellationToken cancel;
    InstanceLifecycle lifecycle(api, clock, events);

    SECTION("down succeeds") {
        REQUIRE(run_down(command_config(), lifecycle) == kExitOk);
        REQUIRE(api.terminated_ids == std::vector<std::string>{"i-1"});
    }

    SECTION("down reports API errors") {
        api.fail_terminate_with("global/object-does-not-exist");
        REQUIRE(run_down(command_config(), lifecycle) == kExitFailure);
    }

    SECTION("ssh needs an IP") {
        api.queue_status(InstanceStatus::Booting);
        REQUIRE(run_ssh(command_config(), lifecycle) == kExitFailure);
    }

    SECTION("ssh with an IP") {
        api.queue_status(InstanceStatus::Active, "192.0.2.1");
        REQUIRE(run_ssh(command_config(), lifecycle) == kExitOk);
    }

    SECTION("unknown command") {
        REQUIRE(run_command("reboot", command_config(), lifecycle, cancel) == kExitFailure);
    }
}

// ============================================================================
// list
// ============================================================================

namespace {

InstanceTypeOffer make_offer(const std::string& name, int cents, std::vector<std::string> regions) {
    InstanceTypeOffer offer;
    offer.name = name;
    offer.price_cents_per_hour = cents;
    offer.regions_with_capacity = std::move(regions);
    return offer;
}

} // namespace

TEST_CASE("format_instance_row shows id, status and ip", "[commands]") {
    auto instance = make_instance("i-1", InstanceStatus::Active, std::string("192.0.2.1"));
    instance.name = "devbox";
    auto row = format_instance_row(instance);

    REQUIRE(row.find("i-1") == 0);
    REQUIRE(row.find("active") != std::string::npos);
    REQUIRE(row.find("192.0.2.1") != std::string::npos);
    REQUIRE(row.find("devbox") != std::string::npos);

    auto no_ip = format_instance_row(make_instance("i-2", InstanceStatus::Booting));
    REQUIRE(no_ip.find(" - ") != std::string::npos);
}

TEST_CASE("sort_instance_types puts available types first", "[commands]") {
    std::vector<InstanceTypeOffer> offers = {
        make_offer("cheap_busy", 50, {}),
        make_offer("cheap_free", 50, {"us-east-1"}),
        make_offer("pricey_free", 300, {"us-west-1"}),
        make_offer("pricey_busy", 900, {}),
    };

    auto sorted = sort_instance_types(offers, false);
    REQUIRE(sorted.size() == 4);
    REQUIRE(sorted[0].name == "pricey_free");
    REQUIRE(sorted[1].name == "cheap_free");
    REQUIRE(sorted[2].name == "pricey_busy");
    REQUIRE(sorted[3].name == "cheap_busy");

    auto available = sort_instance_types(offers, true);
    REQUIRE(available.size() == 2);
    REQUIRE(available[0].name == "pricey_free");
}

TEST_CASE("format_instance_type shows price and capacity regions", "[commands]") {
    auto offer = make_offer("gpu_1x_a100", 129, {"us-east-1", "us-west-1"});
    auto text = format_instance_type(offer);

    REQUIRE(text.find("gpu_1x_a100") == 0);
    REQUIRE(text.find("$1.29/hour") != std::string::npos);
    REQUIRE(text.find("$30.96/day") != std::string::npos);
    REQUIRE(text.find("us-east-1, us-west-1") != std::string::npos);

    REQUIRE(format_instance_type(make_offer("busy", 10, {})).find("capacity: none") != std::string::npos);
}

TEST_CASE("run_list", "[commands]") {
    FakeCloudApi api;
    FakeClock clock;
    RecordingEventSink events;
    InstanceLifecycle lifecycle(api, clock, events);
    auto config = command_config();

    SECTION("instances") {
        api.instances = {make_instance("i-1", InstanceStatus::Active, std::string("192.0.2.1"))};
        REQUIRE(run_list(config, lifecycle) == kExitOk);
        REQUIRE(api.list_calls == 1);
    }

    SECTION("no instances") {
        REQUIRE(run_list(config, lifecycle) == kExitOk);
    }

    SECTION("instance types") {
        config.list_resource = "instance-types";
        config.available_only = true;
        api.instance_types = {make_offer("gpu_1x_a100", 129, {"us-east-1"})};
        REQUIRE(run_list(config, lifecycle) == kExitOk);
        REQUIRE(api.list_calls == 1);
    }

    SECTION("API error") {
        api.fail_list_with("global/invalid-api-key");
        REQUIRE(run_list(config, lifecycle) == kExitFailure);
    }

    SECTION("dispatch") {
        CancellationToken cancel;
        REQUIRE(run_command("list", config, lifecycle, cancel) == kExitOk);
        REQUIRE(api.list_calls == 1);
    }
}
