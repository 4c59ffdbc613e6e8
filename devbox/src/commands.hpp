#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "instance_lifecycle.hpp"
#include <string>
#include <vector>

// Process exit codes.
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 130;

std::string ssh_command(const std::string& ip, const std::string& username);

// One line per instance: id, status, ip, region, type, name.
std::string format_instance_row(const InstanceHandle& instance);

// Types with capacity first, then by price (highest first), then by name.
std::vector<InstanceTypeOffer> sort_instance_types(std::vector<InstanceTypeOffer> offers,
                                                   bool available_only);
std::string format_instance_type(const InstanceTypeOffer& offer);

int run_up(const Config& config, InstanceLifecycle& lifecycle, const CancellationToken& cancel);
int run_wait(const Config& config, InstanceLifecycle& lifecycle, const CancellationToken& cancel);
int run_down(const Config& config, InstanceLifecycle& lifecycle);
int run_ssh(const Config& config, InstanceLifecycle& lifecycle);
int run_list(const Config& config, InstanceLifecycle& lifecycle);

// Dispatches to the run_* function named by command.
int run_command(const std::string& command, const Config& config, InstanceLifecycle& lifecycle,
                const CancellationToken& cancel);
