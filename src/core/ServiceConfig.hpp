#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphub {

using json = nlohmann::json;

/**
 * @brief Wire mechanism used to reach a service
 */
enum class TransportType {
    Stdio,
    Http,
    WebSocket
};

/**
 * @brief Convert transport type to its config-file string ("stdio", "http", "websocket")
 */
std::string transport_to_string(TransportType type);

/**
 * @brief Parse config-file string into transport type
 * @throws std::invalid_argument on unknown transport name
 */
TransportType transport_from_string(const std::string& name);

/**
 * @brief Configuration record for one remote MCP service
 *
 * Persisted as one JSON file per service. The name is the registry key
 * and determines the file name.
 */
struct ServiceConfig {
    std::string name;
    std::string description;
    TransportType transport = TransportType::Stdio;
    std::string endpoint;               // URL, or launch command for stdio
    int timeout_seconds = 30;
    int retry_count = 3;
    bool enabled = true;
    std::optional<json> auth;
    std::optional<std::map<std::string, std::string>> headers;
    std::optional<std::vector<std::string>> args;  // stdio only

    bool operator==(const ServiceConfig& other) const;
    bool operator!=(const ServiceConfig& other) const { return !(*this == other); }
};

void to_json(json& j, const ServiceConfig& config);

/**
 * @brief Decode a service record, applying defaults for missing fields
 * @throws std::invalid_argument if name, transport or endpoint are missing or invalid
 */
void from_json(const json& j, ServiceConfig& config);

} // namespace mcphub
