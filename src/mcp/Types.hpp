#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcphub {

using json = nlohmann::json;

constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

/**
 * @brief Identity this client presents in the initialize handshake
 */
struct ClientInfo {
    std::string name;
    std::string version;
};

/**
 * @brief Peer identity reported in the initialize result
 */
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    json capabilities = json::object();
};

/**
 * @brief Metadata for a tool exposed by a service
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema = json::object();  // JSON Schema for tool arguments
};

/**
 * @brief Resource advertised by resources/list
 */
struct ResourceInfo {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

/**
 * @brief Prompt template advertised by prompts/list
 */
struct PromptInfo {
    std::string name;
    std::string description;
    json arguments = json::array();
};

void to_json(json& j, const ServerInfo& info);
void to_json(json& j, const ToolInfo& info);
void to_json(json& j, const ResourceInfo& info);
void to_json(json& j, const PromptInfo& info);

/**
 * @brief Decode peer-supplied records; missing optional fields get defaults
 * @throws nlohmann::json::exception when a present field has the wrong type
 */
void from_json(const json& j, ServerInfo& info);
void from_json(const json& j, ToolInfo& info);
void from_json(const json& j, ResourceInfo& info);
void from_json(const json& j, PromptInfo& info);

} // namespace mcphub
