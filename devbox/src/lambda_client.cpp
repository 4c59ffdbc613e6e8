#include "lambda_client.hpp"
#include "lambda_json.hpp"
#include <chrono>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

class LambdaClient::Impl {
public:
    explicit Impl(const Config& config)
        : base_url_(config.api_base_url),
          api_key_(config.api_key),
          timeout_ms_(std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::seconds(config.api_timeout_seconds))) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
        spdlog::debug("Lambda Cloud client for {}", base_url_);
    }

    InstanceHandle launch(const LaunchRequest& request) {
        auto payload = lambda_json::launch_payload(request);

        auto response = cpr::Post(
            cpr::Url{base_url_ + "/instance-operations/launch"},
            headers(true),
            cpr::Body{payload.dump()},
            cpr::Timeout{timeout_ms_}
        );
        check("POST", "/instance-operations/launch", response);

        auto ids = lambda_json::parse_launch_response(response.text);
        if (ids.size() > 1) {
            spdlog::warn("Launch returned {} instances, tracking {}", ids.size(), ids.front());
        }

        InstanceHandle instance;
        instance.id = ids.front();
        instance.status = InstanceStatus::Booting;
        instance.region = request.region;
        instance.instance_type = request.instance_type;
        instance.name = request.instance_name.value_or("");
        return instance;
    }

    InstanceHandle get_instance(const std::string& instance_id) {
        auto path = "/instances/" + instance_id;

        auto response = cpr::Get(
            cpr::Url{base_url_ + path},
            headers(false),
            cpr::Timeout{timeout_ms_}
        );
        check("GET", path, response);

        return lambda_json::parse_instance_response(response.text);
    }

    std::vector<InstanceHandle> terminate(const std::vector<std::string>& instance_ids) {
        auto payload = lambda_json::terminate_payload(instance_ids);

        auto response = cpr::Post(
            cpr::Url{base_url_ + "/instance-operations/terminate"},
            headers(true),
            cpr::Body{payload.dump()},
            cpr::Timeout{timeout_ms_}
        );
        check("POST", "/instance-operations/terminate", response);

        return lambda_json::parse_terminate_response(response.text);
    }

    std::vector<InstanceHandle> list_instances() {
        auto response = cpr::Get(
            cpr::Url{base_url_ + "/instances"},
            headers(false),
            cpr::Timeout{timeout_ms_}
        );
        check("GET", "/instances", response);

        return lambda_json::parse_instances_response(response.text);
    }

    std::vector<InstanceTypeOffer> list_instance_types() {
        auto response = cpr::Get(
            cpr::Url{base_url_ + "/instance-types"},
            headers(false),
            cpr::Timeout{timeout_ms_}
        );
        check("GET", "/instance-types", response);

        return lambda_json::parse_instance_types_response(response.text);
    }

private:
    cpr::Header headers(bool with_body) const {
        cpr::Header header{
            {"Authorization", "Bearer " + api_key_},
            {"Accept", "application/json"},
            {"User-Agent", "devbox/1.0"}
        };
        if (with_body) {
            header["Content-Type"] = "application/json";
        }
        return header;
    }

    // Turns transport failures and HTTP errors into ApiException.
    void check(const char* method, const std::string& path, const cpr::Response& response) const {
        if (response.error) {
            ApiError error;
            error.code = "client/transport-error";
            error.message = std::string(method) + " " + path + " failed: " + response.error.message;
            spdlog::debug("{}", error.message);
            throw ApiException(error);
        }

        if (response.status_code >= 400) {
            auto error = lambda_json::parse_error(static_cast<int>(response.status_code), response.text);
            spdlog::debug("{} {} -> {} {}", method, path, response.status_code, error.code);
            throw ApiException(error);
        }

        spdlog::debug("{} {} -> {}", method, path, response.status_code);
    }

    std::string base_url_;
    std::string api_key_;
    std::chrono::milliseconds timeout_ms_;
};

// --- PIMPL forward declarations ---
LambdaClient::LambdaClient(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
LambdaClient::~LambdaClient() = default;
InstanceHandle LambdaClient::launch(const LaunchRequest& request) {
    return pImpl_->launch(request);
}
InstanceHandle LambdaClient::get_instance(const std::string& instance_id) {
    return pImpl_->get_instance(instance_id);
}
std::vector<InstanceHandle> LambdaClient::terminate(const std::vector<std::string>& instance_ids) {
    return pImpl_->terminate(instance_ids);
}
std::vector<InstanceHandle> LambdaClient::list_instances() {
    return pImpl_->list_instances();
}
std::vector<InstanceTypeOffer> LambdaClient::list_instance_types() {
    return pImpl_->list_instance_types();
}
