#include "ServiceConfig.hpp"
#include <stdexcept>

namespace mcphub {

std::string transport_to_string(TransportType type) {
    switch (type) {
        case TransportType::Stdio:
            return "stdio";
        case TransportType::Http:
            return "http";
        case TransportType::WebSocket:
            return "websocket";
    }
    return "stdio";
}

TransportType transport_from_string(const std::string& name) {
    if (name == "stdio") {
        return TransportType::Stdio;
    } else if (name == "http") {
        return TransportType::Http;
    } else if (name == "websocket") {
        return TransportType::WebSocket;
    }
    throw std::invalid_argument("Unknown transport: " + name);
}

bool ServiceConfig::operator==(const ServiceConfig& other) const {
    return name == other.name &&
           description == other.description &&
           transport == other.transport &&
           endpoint == other.endpoint &&
           timeout_seconds == other.timeout_seconds &&
           retry_count == other.retry_count &&
           enabled == other.enabled &&
           auth == other.auth &&
           headers == other.headers &&
           args == other.args;
}

void to_json(json& j, const ServiceConfig& config) {
    j = {
        {"name", config.name},
        {"description", config.description},
        {"transport", transport_to_string(config.transport)},
        {"endpoint", config.endpoint},
        {"timeout", config.timeout_seconds},
        {"retry_count", config.retry_count},
        {"enabled", config.enabled},
        {"auth", config.auth ? *config.auth : json()},
        {"headers", config.headers ? json(*config.headers) : json()},
        {"args", config.args ? json(*config.args) : json()}
    };
}

void from_json(const json& j, ServiceConfig& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("Service record must be a JSON object");
    }
    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) {
        throw std::invalid_argument("Service record is missing a name");
    }
    if (!j.contains("transport") || !j["transport"].is_string()) {
        throw std::invalid_argument("Service record is missing a transport");
    }
    if (!j.contains("endpoint") || !j["endpoint"].is_string()) {
        throw std::invalid_argument("Service record is missing an endpoint");
    }

    config.name = j["name"].get<std::string>();
    config.description = j.value("description", "");
    config.transport = transport_from_string(j["transport"].get<std::string>());
    config.endpoint = j["endpoint"].get<std::string>();
    config.timeout_seconds = j.value("timeout", 30);
    config.retry_count = j.value("retry_count", 3);
    config.enabled = j.value("enabled", true);

    config.auth.reset();
    if (j.contains("auth") && !j["auth"].is_null()) {
        if (!j["auth"].is_object()) {
            throw std::invalid_argument("auth must be an object");
        }
        config.auth = j["auth"];
    }

    config.headers.reset();
    if (j.contains("headers") && !j["headers"].is_null()) {
        config.headers = j["headers"].get<std::map<std::string, std::string>>();
    }

    config.args.reset();
    if (j.contains("args") && !j["args"].is_null()) {
        config.args = j["args"].get<std::vector<std::string>>();
    }
}

} // namespace mcphub
