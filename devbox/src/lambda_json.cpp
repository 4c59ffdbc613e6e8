#include "lambda_json.hpp"
#include "util.hpp"
#include <utility>

namespace lambda_json {

namespace {

constexpr size_t kMaxErrorText = 200;

[[noreturn]] void throw_invalid(const std::string& message) {
    ApiError error;
    error.code = "client/invalid-response";
    error.message = message;
    throw ApiException(error);
}

nlohmann::json parse_body(const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw_invalid(std::string("Malformed JSON response: ") + e.what());
    }
}

// Responses wrap their payload in "data".
const nlohmann::json& payload(const nlohmann::json& json) {
    if (json.is_object() && json.contains("data")) {
        return json["data"];
    }
    return json;
}

std::string string_field(const nlohmann::json& json, const char* key) {
    if (json.is_object() && json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return "";
}

int int_field(const nlohmann::json& json, const char* key) {
    if (json.is_object() && json.contains(key) && json[key].is_number()) {
        return json[key].get<int>();
    }
    return 0;
}

std::string nested_name(const nlohmann::json& json, const char* key) {
    if (json.is_object() && json.contains(key) && json[key].is_object()) {
        return string_field(json[key], "name");
    }
    return "";
}

} // namespace

nlohmann::json launch_payload(const LaunchRequest& request) {
    nlohmann::json payload = {
        {"region_name", request.region},
        {"instance_type_name", request.instance_type},
        {"ssh_key_names", nlohmann::json::array({request.ssh_key_name})},
    };

    if (request.filesystem_name) {
        payload["file_system_names"] = nlohmann::json::array({*request.filesystem_name});
    }
    if (request.instance_name) {
        payload["name"] = *request.instance_name;
    }
    if (request.image_id) {
        payload["image"] = {{"id", *request.image_id}};
    }
    if (request.user_data) {
        payload["user_data"] = *request.user_data;
    }

    return payload;
}

nlohmann::json terminate_payload(const std::vector<std::string>& instance_ids) {
    return {{"instance_ids", instance_ids}};
}

InstanceStatus parse_status(const std::string& status) {
    auto value = util::to_lower(status);
    if (value == "booting") return InstanceStatus::Booting;
    if (value == "active") return InstanceStatus::Active;
    if (value == "unhealthy") return InstanceStatus::Unhealthy;
    if (value == "terminated" || value == "terminating" || value == "preempted") {
        return InstanceStatus::Terminated;
    }
    return InstanceStatus::Unknown;
}

InstanceHandle parse_instance(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw_invalid("Instance is not a JSON object");
    }

    InstanceHandle instance;
    instance.id = string_field(data, "id");
    if (instance.id.empty()) {
        throw_invalid("Instance without an id");
    }

    instance.status = parse_status(string_field(data, "status"));

    auto ip = string_field(data, "ip");
    if (!ip.empty()) {
        instance.ip = ip;
    }

    instance.name = string_field(data, "name");
    instance.region = nested_name(data, "region");
    instance.instance_type = nested_name(data, "instance_type");
    return instance;
}

std::vector<std::string> parse_launch_response(const std::string& body) {
    auto json = parse_body(body);
    const auto& data = payload(json);

    if (!data.is_object() || !data.contains("instance_ids") || !data["instance_ids"].is_array()) {
        throw_invalid("Launch response without instance_ids");
    }

    std::vector<std::string> ids;
    for (const auto& id : data["instance_ids"]) {
        if (id.is_string()) {
            ids.push_back(id.get<std::string>());
        }
    }

    if (ids.empty()) {
        ApiError error;
        error.code = "client/empty-launch-response";
        error.message = "Launch returned no instance ids";
        throw ApiException(error);
    }
    return ids;
}

InstanceHandle parse_instance_response(const std::string& body) {
    auto json = parse_body(body);
    return parse_instance(payload(json));
}

std::vector<InstanceHandle> parse_terminate_response(const std::string& body) {
    auto json = parse_body(body);
    const auto& data = payload(json);

    std::vector<InstanceHandle> terminated;
    if (data.is_object() && data.contains("terminated_instances") &&
        data["terminated_instances"].is_array()) {
        for (const auto& item : data["terminated_instances"]) {
            terminated.push_back(parse_instance(item));
        }
    }
    return terminated;
}

std::vector<InstanceHandle> parse_instances_response(const std::string& body) {
    auto json = parse_body(body);
    const auto& data = payload(json);

    if (!data.is_array()) {
        throw_invalid("Instance list is not a JSON array");
    }

    std::vector<InstanceHandle> instances;
    for (const auto& item : data) {
        instances.push_back(parse_instance(item));
    }
    return instances;
}

// "data" maps each type name to {instance_type, regions_with_capacity_available}.
std::vector<InstanceTypeOffer> parse_instance_types_response(const std::string& body) {
    auto json = parse_body(body);
    const auto& data = payload(json);

    if (!data.is_object()) {
        throw_invalid("Instance types are not a JSON object");
    }

    std::vector<InstanceTypeOffer> offers;
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string& key = it.key();
        const auto& item = it.value();
        if (!item.is_object() || !item.contains("instance_type")) {
            throw_invalid("Instance type " + key + " without details");
        }
        const auto& type = item["instance_type"];

        InstanceTypeOffer offer;
        offer.name = string_field(type, "name");
        if (offer.name.empty()) {
            offer.name = key;
        }
        offer.description = string_field(type, "description");
        offer.gpu_description = string_field(type, "gpu_description");
        offer.price_cents_per_hour = int_field(type, "price_cents_per_hour");

        if (type.is_object() && type.contains("specs")) {
            const auto& specs = type["specs"];
            offer.vcpus = int_field(specs, "vcpus");
            offer.memory_gib = int_field(specs, "memory_gib");
            offer.storage_gib = int_field(specs, "storage_gib");
            offer.gpus = int_field(specs, "gpus");
        }

        if (item.contains("regions_with_capacity_available") &&
            item["regions_with_capacity_available"].is_array()) {
            for (const auto& region : item["regions_with_capacity_available"]) {
                auto name = string_field(region, "name");
                if (!name.empty()) {
                    offer.regions_with_capacity.push_back(name);
                }
            }
        }
        offers.push_back(std::move(offer));
    }
    return offers;
}

ApiError parse_error(int http_status, const std::string& body) {
    ApiError error;
    error.http_status = http_status;

    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("error") && json["error"].is_object()) {
        const auto& detail = json["error"];
        error.code = string_field(detail, "code");
        error.message = string_field(detail, "message");
        error.suggestion = string_field(detail, "suggestion");
    }

    if (error.message.empty()) {
        auto text = util::trim(body);
        if (text.size() > kMaxErrorText) {
            text = text.substr(0, kMaxErrorText) + "...";
        }
        error.message = "HTTP " + std::to_string(http_status) + (text.empty() ? "" : ": " + text);
    }
    return error;
}

} // namespace lambda_json
