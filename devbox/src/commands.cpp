#include "commands.hpp"
#include "cloud_init.hpp"
#include "error_classifier.hpp"
#include "events.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <tuple>
#include <utility>

namespace {

int exit_code(const LaunchOutcome& outcome) {
    if (outcome.ok()) {
        return kExitOk;
    }
    return outcome.failure->kind == FailureKind::Cancelled ? kExitCancelled : kExitFailure;
}

int report_api_error(const std::string& action, const ApiException& e) {
    LaunchFailure failure;
    failure.kind = FailureKind::FatalError;
    failure.error = ErrorClassifier().classify(e.error());

    spdlog::error("{} failed: {}", action, failure.error->message);
    auto hint = failure_hint(failure);
    if (!hint.empty()) {
        spdlog::error("Hint: {}", hint);
    }
    return kExitFailure;
}

void print_ready(const Config& config, const InstanceHandle& instance) {
    spdlog::info("Instance {} ({}) in {}", instance.id, instance.instance_type, instance.region);
    if (instance.ip) {
        spdlog::info("SSH: {}", ssh_command(*instance.ip, config.ssh_username));
    }

    BootScriptContext context;
    context.filesystem_name = config.filesystem_name;
    if (!context.filesystem_mount().empty()) {
        spdlog::info("Persistent storage: {}", context.filesystem_mount());
    }
}

} // namespace

std::string ssh_command(const std::string& ip, const std::string& username) {
    return "ssh " + username + "@" + ip;
}

std::string format_instance_row(const InstanceHandle& instance) {
    return fmt::format("{:<34} {:<11} {:<15} {:<16} {:<20} {}",
                       instance.id, to_string(instance.status), instance.ip.value_or("-"),
                       instance.region, instance.instance_type, instance.name);
}

std::vector<InstanceTypeOffer> sort_instance_types(std::vector<InstanceTypeOffer> offers,
                                                   bool available_only) {
    if (available_only) {
        offers.erase(std::remove_if(offers.begin(), offers.end(),
                                    [](const InstanceTypeOffer& o) { return !o.has_capacity(); }),
                     offers.end());
    }

    std::sort(offers.begin(), offers.end(), [](const InstanceTypeOffer& a, const InstanceTypeOffer& b) {
        return std::make_tuple(!a.has_capacity(), -a.price_cents_per_hour, a.name) <
               std::make_tuple(!b.has_capacity(), -b.price_cents_per_hour, b.name);
    });
    return offers;
}

std::string format_instance_type(const InstanceTypeOffer& offer) {
    double dollars = offer.price_cents_per_hour / 100.0;
    std::string regions = offer.has_capacity()
        ? fmt::format("{}", fmt::join(offer.regions_with_capacity, ", "))
        : "none";

    return fmt::format("{} - {} | {} | GPUs {} | vCPUs {} | RAM {} GiB | storage {} GiB | "
                       "${:.2f}/hour (${:.2f}/day) | capacity: {}",
                       offer.name, offer.description, offer.gpu_description,
                       offer.gpus, offer.vcpus, offer.memory_gib, offer.storage_gib,
                       dollars, dollars * 24, regions);
}

int run_up(const Config& config, InstanceLifecycle& lifecycle, const CancellationToken& cancel) {
    auto request = config.launch_request();

    LaunchOutcome outcome = config.wait_after_launch
        ? lifecycle.bring_up(request, config.retry_config(), config.poll_config(), cancel)
        : lifecycle.launch(request, config.retry_config(), cancel);

    if (outcome.ok()) {
        print_ready(config, *outcome.instance);
    }
    return exit_code(outcome);
}

int run_wait(const Config& config, InstanceLifecycle& lifecycle, const CancellationToken& cancel) {
    LaunchOutcome outcome = lifecycle.wait_ready(config.instance_id, config.poll_config(), cancel);
    if (outcome.ok()) {
        print_ready(config, *outcome.instance);
    }
    return exit_code(outcome);
}

int run_down(const Config& config, InstanceLifecycle& lifecycle) {
    try {
        auto terminated = lifecycle.terminate(config.instance_id);
        if (terminated.empty()) {
            spdlog::warn("No instance was reported terminated for {}", config.instance_id);
        }
        for (const auto& instance : terminated) {
            spdlog::info("Instance {} {}", instance.id, to_string(instance.status));
        }
        return kExitOk;
    } catch (const ApiException& e) {
        return report_api_error("Terminate " + config.instance_id, e);
    }
}

int run_ssh(const Config& config, InstanceLifecycle& lifecycle) {
    try {
        auto instance = lifecycle.describe(config.instance_id);
        if (!instance.ip) {
            spdlog::error("Instance {} has no IP address yet ({})",
                          instance.id, to_string(instance.status));
            return kExitFailure;
        }
        spdlog::info("{}", ssh_command(*instance.ip, config.ssh_username));
        return kExitOk;
    } catch (const ApiException& e) {
        return report_api_error("Lookup of " + config.instance_id, e);
    }
}

int run_list(const Config& config, InstanceLifecycle& lifecycle) {
    try {
        if (config.list_resource == "instance-types") {
            auto offers = lifecycle.list_instance_types();
            auto total = offers.size();
            auto available = std::count_if(offers.begin(), offers.end(),
                                           [](const InstanceTypeOffer& o) { return o.has_capacity(); });

            for (const auto& offer : sort_instance_types(std::move(offers), config.available_only)) {
                spdlog::info("{}", format_instance_type(offer));
            }
            spdlog::info("{} of {} instance types have capacity available", available, total);
            return kExitOk;
        }

        auto instances = lifecycle.list_instances();
        if (instances.empty()) {
            spdlog::info("No instances found");
            return kExitOk;
        }
        for (const auto& instance : instances) {
            spdlog::info("{}", format_instance_row(instance));
        }
        return kExitOk;
    } catch (const ApiException& e) {
        return report_api_error("Listing " + config.list_resource, e);
    }
}

int run_command(const std::string& command, const Config& config, InstanceLifecycle& lifecycle,
                const CancellationToken& cancel) {
    if (command == "up") return run_up(config, lifecycle, cancel);
    if (command == "wait") return run_wait(config, lifecycle, cancel);
    if (command == "down") return run_down(config, lifecycle);
    if (command == "ssh") return run_ssh(config, lifecycle);
    if (command == "list") return run_list(config, lifecycle);

    spdlog::error("Unknown command '{}'", command);
    return kExitFailure;
}
