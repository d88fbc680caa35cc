#include "Types.hpp"

namespace mcphub {

void to_json(json& j, const ServerInfo& info) {
    j = {
        {"name", info.name},
        {"version", info.version},
        {"protocolVersion", info.protocol_version},
        {"capabilities", info.capabilities}
    };
}

void from_json(const json& j, ServerInfo& info) {
    info.name = j.value("name", "");
    info.version = j.value("version", "");
    info.protocol_version = j.value("protocolVersion", std::string(MCP_PROTOCOL_VERSION));
    info.capabilities = j.value("capabilities", json::object());
}

void to_json(json& j, const ToolInfo& info) {
    j = {
        {"name", info.name},
        {"description", info.description},
        {"inputSchema", info.input_schema}
    };
}

void from_json(const json& j, ToolInfo& info) {
    info.name = j.at("name").get<std::string>();
    info.description = j.value("description", "");
    info.input_schema = j.value("inputSchema", json::object());
}

void to_json(json& j, const ResourceInfo& info) {
    j = {
        {"uri", info.uri},
        {"name", info.name}
    };
    if (info.description) {
        j["description"] = *info.description;
    }
    if (info.mime_type) {
        j["mimeType"] = *info.mime_type;
    }
}

void from_json(const json& j, ResourceInfo& info) {
    info.uri = j.at("uri").get<std::string>();
    info.name = j.value("name", info.uri);
    info.description.reset();
    info.mime_type.reset();
    if (j.contains("description") && j["description"].is_string()) {
        info.description = j["description"].get<std::string>();
    }
    if (j.contains("mimeType") && j["mimeType"].is_string()) {
        info.mime_type = j["mimeType"].get<std::string>();
    }
}

void to_json(json& j, const PromptInfo& info) {
    j = {
        {"name", info.name},
        {"description", info.description},
        {"arguments", info.arguments}
    };
}

void from_json(const json& j, PromptInfo& info) {
    info.name = j.at("name").get<std::string>();
    info.description = j.value("description", "");
    info.arguments = j.value("arguments", json::array());
}

} // namespace mcphub
