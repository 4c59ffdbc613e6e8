#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// What to launch. Built once per series of launch attempts.
struct LaunchRequest {
    std::string region;
    std::string instance_type;
    std::string ssh_key_name;
    std::optional<std::string> filesystem_name;
    std::optional<std::string> instance_name;
    std::optional<std::string> image_id;
    std::optional<std::string> user_data; // base64 boot script
};

struct RetryConfig {
    int max_attempts = 20;                         // retries after the first call; 0 disables retry
    std::chrono::milliseconds initial_delay{5000};
    std::chrono::milliseconds max_delay{60000};
    double multiplier = 1.5;
    double jitter_factor = 0.0;                    // +/- fraction, 0 keeps delays deterministic

    void validate() const;
};

struct PollConfig {
    std::chrono::milliseconds poll_interval{10000};
    std::chrono::milliseconds timeout{900000};

    void validate() const;
};

enum class InstanceStatus {
    Booting,
    Active,
    Unhealthy,
    Terminated,
    Unknown
};

const char* to_string(InstanceStatus status);

struct InstanceHandle {
    std::string id;
    InstanceStatus status = InstanceStatus::Unknown;
    std::optional<std::string> ip;
    std::string name;
    std::string region;
    std::string instance_type;
};

// An instance type on offer and the regions that can launch it right now.
struct InstanceTypeOffer {
    std::string name;
    std::string description;
    std::string gpu_description;
    int price_cents_per_hour = 0;
    int vcpus = 0;
    int memory_gib = 0;
    int storage_gib = 0;
    int gpus = 0;
    std::vector<std::string> regions_with_capacity;

    bool has_capacity() const { return !regions_with_capacity.empty(); }
};

// Error as reported by the provisioning API.
struct ApiError {
    std::string code;
    std::string message;
    std::string suggestion;
    int http_status = 0;
};

class ApiException : public std::runtime_error {
public:
    explicit ApiException(ApiError error);

    const ApiError& error() const { return error_; }

private:
    ApiError error_;
};

enum class ErrorKind {
    Capacity,
    Auth,
    Quota,
    Validation,
    NotFound,
    Unknown
};

const char* to_string(ErrorKind kind);

struct ClassifiedError {
    ErrorKind kind = ErrorKind::Unknown;
    std::string code;
    std::string message;
    std::string suggestion;
    bool retryable = false;
};

enum class FailureKind {
    RetriesExhausted,
    FatalError,
    PollTimeout,
    InstanceFailed,
    Cancelled
};

const char* to_string(FailureKind kind);

struct LaunchFailure {
    FailureKind kind = FailureKind::FatalError;
    std::optional<ClassifiedError> error;
    std::optional<InstanceHandle> instance; // set once a launch was confirmed
    int attempts = 0;                       // launch calls made
    std::chrono::milliseconds elapsed{0};

    std::string describe() const;
};

// Result of the launch phase.
struct LaunchResult {
    std::optional<InstanceHandle> instance;
    std::optional<LaunchFailure> failure;
    int attempts = 0;

    bool ok() const { return instance.has_value() && !failure.has_value(); }
};

// Result of the readiness phase.
struct PollResult {
    std::optional<InstanceHandle> instance;
    std::optional<LaunchFailure> failure;
    int polls = 0;

    bool ok() const { return instance.has_value() && !failure.has_value(); }
};

// Terminal result of bringing an instance up.
struct LaunchOutcome {
    std::optional<InstanceHandle> instance;
    std::optional<LaunchFailure> failure;

    bool ok() const { return instance.has_value() && !failure.has_value(); }
};
