#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Provisioning API used by the launch engine. Implementations throw
// ApiException for every failure the remote side (or the transport) reports.
class CloudApi {
public:
    virtual ~CloudApi() = default;

    virtual InstanceHandle launch(const LaunchRequest& request) = 0;
    virtual InstanceHandle get_instance(const std::string& instance_id) = 0;
    virtual std::vector<InstanceHandle> terminate(const std::vector<std::string>& instance_ids) = 0;

    virtual std::vector<InstanceHandle> list_instances() = 0;
    virtual std::vector<InstanceTypeOffer> list_instance_types() = 0;
};
