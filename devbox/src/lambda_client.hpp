#pragma once

#include "cloud_api.hpp"
#include "config.hpp"
#include <memory>
#include <string>
#include <vector>

// CloudApi over the Lambda Cloud REST API.
class LambdaClient : public CloudApi {
public:
    explicit LambdaClient(const Config& config);
    ~LambdaClient() override;

    InstanceHandle launch(const LaunchRequest& request) override;
    InstanceHandle get_instance(const std::string& instance_id) override;
    std::vector<InstanceHandle> terminate(const std::vector<std::string>& instance_ids) override;
    std::vector<InstanceHandle> list_instances() override;
    std::vector<InstanceTypeOffer> list_instance_types() override;

    // Non-copyable
    LambdaClient(const LambdaClient&) = delete;
    LambdaClient& operator=(const LambdaClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
