#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Lambda Cloud API wire format.
namespace lambda_json {

nlohmann::json launch_payload(const LaunchRequest& request);
nlohmann::json terminate_payload(const std::vector<std::string>& instance_ids);

InstanceStatus parse_status(const std::string& status);
InstanceHandle parse_instance(const nlohmann::json& data);

// Response bodies. Throw ApiException with a client/ code on malformed input.
std::vector<std::string> parse_launch_response(const std::string& body);
InstanceHandle parse_instance_response(const std::string& body);
std::vector<InstanceHandle> parse_terminate_response(const std::string& body);
std::vector<InstanceHandle> parse_instances_response(const std::string& body);
std::vector<InstanceTypeOffer> parse_instance_types_response(const std::string& body);

// Error body of a failed request. Never throws.
ApiError parse_error(int http_status, const std::string& body);

} // namespace lambda_json
