#include "config.hpp"
#include "cloud_init.hpp"
#include "util.hpp"
#include <cmath>
#include <functional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

using Setter = std::function<void(Config&, const std::string&)>;

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"api_base_url", [](Config& c, const std::string& v) { c.api_base_url = v; }},
        {"api_key", [](Config& c, const std::string& v) { c.api_key = v; }},
        {"api_timeout_seconds", [](Config& c, const std::string& v) { c.api_timeout_seconds = std::stoi(v); }},
        {"log_level", [](Config& c, const std::string& v) { c.log_level = v; }},
        {"ssh_username", [](Config& c, const std::string& v) { c.ssh_username = v; }},
        {"region", [](Config& c, const std::string& v) { c.region = v; }},
        {"instance_type", [](Config& c, const std::string& v) { c.instance_type = v; }},
        {"ssh_key_name", [](Config& c, const std::string& v) { c.ssh_key_name = v; }},
        {"filesystem_name", [](Config& c, const std::string& v) { c.filesystem_name = v; }},
        {"instance_name", [](Config& c, const std::string& v) { c.instance_name = v; }},
        {"image_id", [](Config& c, const std::string& v) { c.image_id = v; }},
        {"user_data_file", [](Config& c, const std::string& v) { c.user_data_file = v; }},
        {"wait_after_launch", [](Config& c, const std::string& v) { c.wait_after_launch = util::parse_bool(v); }},
        {"wait_timeout_seconds", [](Config& c, const std::string& v) { c.wait_timeout_seconds = std::stoi(v); }},
        {"poll_interval_seconds", [](Config& c, const std::string& v) { c.poll_interval_seconds = std::stod(v); }},
        {"retry_max_attempts", [](Config& c, const std::string& v) { c.retry_max_attempts = std::stoi(v); }},
        {"retry_initial_delay_seconds", [](Config& c, const std::string& v) { c.retry_initial_delay_seconds = std::stod(v); }},
        {"retry_max_delay_seconds", [](Config& c, const std::string& v) { c.retry_max_delay_seconds = std::stod(v); }},
        {"retry_multiplier", [](Config& c, const std::string& v) { c.retry_multiplier = std::stod(v); }},
        {"retry_jitter", [](Config& c, const std::string& v) { c.retry_jitter = std::stod(v); }},
        {"instance_id", [](Config& c, const std::string& v) { c.instance_id = v; }},
        {"resource", [](Config& c, const std::string& v) { c.list_resource = v; }},
        {"available_only", [](Config& c, const std::string& v) { c.available_only = util::parse_bool(v); }},
    };
    return table;
}

void set_value(Config& config, const std::string& key, const std::string& value) {
    auto it = setters().find(key);
    if (it == setters().end()) {
        throw std::runtime_error("Unknown configuration key '" + key + "'");
    }

    try {
        it->second(config, value);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid value '" + value + "' for " + key);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Value out of range for " + key + ": " + value);
    }
}

// Upper bound for second-valued settings, about a day.
constexpr double kMaxSeconds = 86400.0;

void require_seconds(double value, const std::string& key) {
    if (!std::isfinite(value) || value < 0.0 || value > kMaxSeconds) {
        throw std::runtime_error(key + " must be a number of seconds in [0, 86400]");
    }
}

void require(const std::string& value, const std::string& key) {
    if (value.empty()) {
        throw std::runtime_error(key + " is required");
    }
}

} // namespace

Config Config::from_env() {
    Config config;

    const std::pair<const char*, const char*> env_keys[] = {
        {"LAMBDA_API_URL", "api_base_url"},
        {"LAMBDA_API_KEY", "api_key"},
        {"LAMBDA_API_TIMEOUT_SECONDS", "api_timeout_seconds"},
        {"LOG_LEVEL", "log_level"},
        {"DEVBOX_SSH_USERNAME", "ssh_username"},
        {"DEVBOX_REGION", "region"},
        {"DEVBOX_INSTANCE_TYPE", "instance_type"},
        {"DEVBOX_SSH_KEY_NAME", "ssh_key_name"},
        {"DEVBOX_FILESYSTEM_NAME", "filesystem_name"},
        {"DEVBOX_INSTANCE_NAME", "instance_name"},
        {"DEVBOX_IMAGE_ID", "image_id"},
        {"DEVBOX_USER_DATA_FILE", "user_data_file"},
        {"DEVBOX_WAIT_AFTER_LAUNCH", "wait_after_launch"},
        {"DEVBOX_WAIT_TIMEOUT_SECONDS", "wait_timeout_seconds"},
        {"DEVBOX_POLL_INTERVAL_SECONDS", "poll_interval_seconds"},
        {"DEVBOX_RETRY_MAX_ATTEMPTS", "retry_max_attempts"},
        {"DEVBOX_RETRY_INITIAL_DELAY_SECONDS", "retry_initial_delay_seconds"},
        {"DEVBOX_RETRY_MAX_DELAY_SECONDS", "retry_max_delay_seconds"},
        {"DEVBOX_RETRY_MULTIPLIER", "retry_multiplier"},
        {"DEVBOX_RETRY_JITTER", "retry_jitter"},
        {"DEVBOX_INSTANCE_ID", "instance_id"},
        {"DEVBOX_LIST_RESOURCE", "resource"},
        {"DEVBOX_AVAILABLE_ONLY", "available_only"},
    };

    for (const auto& [env, key] : env_keys) {
        auto value = util::get_env_var(env);
        if (!value.empty()) {
            set_value(config, key, value);
        }
    }

    return config;
}

void Config::apply_overrides(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        auto pos = arg.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw std::runtime_error("Expected key=value, got '" + arg + "'");
        }
        auto key = util::trim(arg.substr(0, pos));
        auto value = util::trim(arg.substr(pos + 1));
        set_value(*this, key, value);
        spdlog::debug("Override {}={}", key, key == "api_key" ? "***" : value);
    }
}

void Config::validate(const std::string& command) const {
    require(api_base_url, "api_base_url");
    require(api_key, "api_key (LAMBDA_API_KEY)");

    if (api_timeout_seconds <= 0 || api_timeout_seconds > kMaxSeconds) {
        throw std::runtime_error("api_timeout_seconds must be in (0, 86400]");
    }

    if (command == "up") {
        require(region, "region");
        require(instance_type, "instance_type");
        require(ssh_key_name, "ssh_key_name");
        require_seconds(retry_initial_delay_seconds, "retry_initial_delay_seconds");
        require_seconds(retry_max_delay_seconds, "retry_max_delay_seconds");
        require_seconds(poll_interval_seconds, "poll_interval_seconds");
        retry_config().validate();
        poll_config().validate();
    } else if (command == "wait") {
        require(instance_id, "instance_id");
        require_seconds(poll_interval_seconds, "poll_interval_seconds");
        poll_config().validate();
    } else if (command == "down" || command == "ssh") {
        require(instance_id, "instance_id");
    } else if (command == "list") {
        if (list_resource != "instances" && list_resource != "instance-types") {
            throw std::runtime_error("resource must be 'instances' or 'instance-types', got '" +
                                     list_resource + "'");
        }
    } else {
        throw std::runtime_error("Unknown command '" + command + "'");
    }
}

RetryConfig Config::retry_config() const {
    RetryConfig retry;
    retry.max_attempts = retry_max_attempts;
    retry.initial_delay = seconds_to_ms(retry_initial_delay_seconds);
    retry.max_delay = seconds_to_ms(retry_max_delay_seconds);
    retry.multiplier = retry_multiplier;
    retry.jitter_factor = retry_jitter;
    return retry;
}

PollConfig Config::poll_config() const {
    PollConfig poll;
    poll.poll_interval = seconds_to_ms(poll_interval_seconds);
    poll.timeout = std::chrono::seconds(wait_timeout_seconds);
    return poll;
}

LaunchRequest Config::launch_request() const {
    LaunchRequest request;
    request.region = region;
    request.instance_type = instance_type;
    request.ssh_key_name = ssh_key_name;
    if (!filesystem_name.empty()) request.filesystem_name = filesystem_name;
    if (!instance_name.empty()) request.instance_name = instance_name;
    if (!image_id.empty()) request.image_id = image_id;

    if (!user_data_file.empty()) {
        BootScriptContext context;
        context.filesystem_name = filesystem_name;
        context.ssh_username = ssh_username;
        request.user_data = load_boot_script(user_data_file, context);
    }

    return request;
}
