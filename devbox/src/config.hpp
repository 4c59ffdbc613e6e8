#pragma once
#include "types.hpp"
#include <string>
#include <vector>

class Config {
public:
    // Lambda Cloud API
    std::string api_base_url = "https://cloud.lambda.ai/api/v1";
    std::string api_key;
    int api_timeout_seconds = 120;

    std::string log_level = "info";

    // SSH
    std::string ssh_username = "ubuntu";

    // Launch
    std::string region;
    std::string instance_type;
    std::string ssh_key_name;
    std::string filesystem_name;
    std::string instance_name;
    std::string image_id;
    std::string user_data_file;
    bool wait_after_launch = true;

    // Readiness polling
    int wait_timeout_seconds = 900;
    double poll_interval_seconds = 10.0;

    // Launch retry on capacity shortage
    int retry_max_attempts = 20;
    double retry_initial_delay_seconds = 5.0;
    double retry_max_delay_seconds = 60.0;
    double retry_multiplier = 1.5;
    double retry_jitter = 0.0;

    // Target of wait / down / ssh
    std::string instance_id;

    // list: "instances" or "instance-types"
    std::string list_resource = "instances";
    bool available_only = false;

    static Config from_env();

    // Applies "key=value" arguments on top of the current values.
    void apply_overrides(const std::vector<std::string>& args);

    // Checks the values a command needs. Throws std::runtime_error.
    void validate(const std::string& command) const;

    RetryConfig retry_config() const;
    PollConfig poll_config() const;
    LaunchRequest launch_request() const;
};
