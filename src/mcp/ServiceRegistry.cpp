#include "ServiceRegistry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace mcphub {

std::filesystem::path RegistryOptions::default_config_dir() {
    if (const char* dir = std::getenv("MCPHUB_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".mcphub" / "mcp";
    }
    return std::filesystem::path(".mcphub") / "mcp";
}

ServiceConfig ServiceRegistry::example_service() {
    ServiceConfig config;
    config.name = "example-filesystem";
    config.description = "Example filesystem MCP server";
    config.transport = TransportType::Stdio;
    config.endpoint = "npx";
    config.args = std::vector<std::string>{"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
    config.enabled = false;
    return config;
}

ServiceRegistry::ServiceRegistry(RegistryOptions options)
    : options_(std::move(options)),
      store_(options_.config_dir) {
    if (!options_.transport_factory) {
        options_.transport_factory = make_transport;
    }
    spdlog::debug("ServiceRegistry using {}", store_.directory().string());
}

ServiceRegistry::~ServiceRegistry() {
    disconnect_all();
}

size_t ServiceRegistry::load_services() {
    auto files = store_.list_files();

    std::map<std::string, ServiceConfig> loaded;
    if (files.empty()) {
        ServiceConfig seed = example_service();
        store_.write(seed);
        loaded[seed.name] = seed;
        spdlog::info("Created example service config in {}", store_.directory().string());
    }

    for (const auto& file : files) {
        try {
            ServiceConfig config = store_.read(file);
            spdlog::debug("Loaded service {} ({})", config.name, transport_to_string(config.transport));
            loaded[config.name] = std::move(config);
        } catch (const std::exception& e) {
            spdlog::error("Failed to load service config {}: {}", file.string(), e.what());
        }
    }

    // Records deleted on disk since the last load take their clients with them
    std::vector<std::shared_ptr<MCPClient>> orphans;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        services_ = loaded;
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (services_.count(it->first) == 0) {
                orphans.push_back(std::move(it->second));
                connect_errors_.erase(it->first);
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& client : orphans) {
        client->disconnect();
    }

    spdlog::info("Loaded {} MCP service(s)", loaded.size());
    return loaded.size();
}

void ServiceRegistry::add_service(const ServiceConfig& config) {
    if (config.name.empty()) {
        throw std::invalid_argument("Service name cannot be empty");
    }
    if (config.endpoint.empty()) {
        throw std::invalid_argument("Service endpoint cannot be empty");
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    // File first: a failed write leaves memory untouched
    store_.write(config);

    std::shared_ptr<MCPClient> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        services_[config.name] = config;
        auto it = clients_.find(config.name);
        if (it != clients_.end()) {
            stale = std::move(it->second);
            clients_.erase(it);
        }
    }

    if (stale) {
        stale->disconnect();
        spdlog::info("Disconnected {} to apply new settings", config.name);
    }
    spdlog::info("Added MCP service: {}", config.name);
}

bool ServiceRegistry::update_service(const ServiceConfig& config) {
    if (!get_service(config.name)) {
        spdlog::warn("Cannot update unknown service {}", config.name);
        return false;
    }
    add_service(config);
    return true;
}

bool ServiceRegistry::remove_service(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (!get_service(name)) {
        return false;
    }

    // File first: a failed delete keeps the service in memory as well
    store_.remove(name);

    std::shared_ptr<MCPClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        services_.erase(name);
        connect_errors_.erase(name);
        auto it = clients_.find(name);
        if (it != clients_.end()) {
            client = std::move(it->second);
            clients_.erase(it);
        }
    }

    if (client) {
        client->disconnect();
    }

    spdlog::info("Removed MCP service: {}", name);
    return true;
}

std::vector<ServiceConfig> ServiceRegistry::list_services() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServiceConfig> result;
    result.reserve(services_.size());
    for (const auto& [name, config] : services_) {
        result.push_back(config);
    }
    return result;
}

std::optional<ServiceConfig> ServiceRegistry::get_service(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = services_.find(name);
    if (it == services_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::chrono::milliseconds ServiceRegistry::backoff_delay(int attempt) const {
    auto delay = options_.backoff_base;
    for (int i = 1; i < attempt && delay < options_.backoff_cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.backoff_cap);
}

bool ServiceRegistry::connect_service(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::shared_ptr<MCPClient> existing;
    std::optional<ServiceConfig> config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(name);
        if (it != clients_.end()) {
            if (it->second->is_connected()) {
                return true;
            }
            // Connection dropped since the last connect
            existing = std::move(it->second);
            clients_.erase(it);
        }
        auto service = services_.find(name);
        if (service != services_.end()) {
            config = service->second;
        }
    }

    if (existing) {
        spdlog::info("Reconnecting {}: {}", name, existing->last_error());
        existing->disconnect();
    }

    auto fail = [this, &name](const std::string& cause) {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_errors_[name] = cause;
        return false;
    };

    if (!config || !config->enabled) {
        spdlog::warn("Service {} not found or disabled", name);
        return fail(config ? "service is disabled" : "service not found");
    }

    int attempts = std::max(1, config->retry_count);
    std::string cause;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto client = std::make_shared<MCPClient>(
                *config, options_.transport_factory(*config), options_.client_info);
            client->connect();

            std::lock_guard<std::mutex> lock(mutex_);
            clients_[name] = std::move(client);
            connect_errors_.erase(name);
            spdlog::info("Connected to MCP service: {}", name);
            return true;
        } catch (const HandshakeError& e) {
            if (!e.transient()) {
                spdlog::error("Failed to connect to {}: {}", name, e.what());
                return fail(e.what());
            }
            cause = e.what();
        } catch (const ConnectionError& e) {
            if (e.reason() == ConnectionError::Reason::ProtocolMismatch) {
                spdlog::error("Failed to connect to {}: {}", name, e.what());
                return fail(e.what());
            }
            cause = e.what();
        } catch (const TimeoutError& e) {
            cause = e.what();
        } catch (const std::exception& e) {
            // Configuration problems (unknown transport, bad arguments) are not retried
            spdlog::error("Failed to connect to {}: {}", name, e.what());
            return fail(e.what());
        }

        if (attempt < attempts) {
            auto delay = backoff_delay(attempt);
            spdlog::warn("Connect attempt {}/{} for {} failed: {}; retrying in {} ms",
                         attempt, attempts, name, cause, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }

    spdlog::error("Failed to connect to {} after {} attempt(s): {}", name, attempts, cause);
    return fail(cause);
}

std::string ServiceRegistry::connect_error(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connect_errors_.find(name);
    return it == connect_errors_.end() ? std::string() : it->second;
}

std::shared_ptr<MCPClient> ServiceRegistry::take_client(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        return nullptr;
    }
    auto client = std::move(it->second);
    clients_.erase(it);
    return client;
}

void ServiceRegistry::disconnect_service(const std::string& name) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    auto client = take_client(name);
    if (client) {
        client->disconnect();
        spdlog::info("Disconnected from MCP service: {}", name);
    }
}

void ServiceRegistry::disconnect_all() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::map<std::string, std::shared_ptr<MCPClient>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.swap(clients_);
    }

    for (auto& [name, client] : clients) {
        client->disconnect();
        spdlog::debug("Disconnected {}", name);
    }
}

std::shared_ptr<MCPClient> ServiceRegistry::get_client(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

std::shared_ptr<MCPClient> ServiceRegistry::connected_client(const std::string& name) const {
    auto client = get_client(name);
    if (!client || !client->is_connected()) {
        throw ConnectionError(ConnectionError::Reason::NotConnected,
                              "Service not connected: " + name);
    }
    return client;
}

std::map<std::string, std::vector<ToolInfo>> ServiceRegistry::list_all_tools() {
    std::map<std::string, std::shared_ptr<MCPClient>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = clients_;
    }

    std::map<std::string, std::vector<ToolInfo>> tools;
    for (const auto& [name, client] : snapshot) {
        if (!client->is_connected()) {
            continue;
        }
        try {
            tools[name] = client->list_tools();
        } catch (const MCPError& e) {
            spdlog::error("Failed to list tools for {}: {}", name, e.what());
            tools[name] = {};
        }
    }
    return tools;
}

json ServiceRegistry::call_tool(const std::string& service, const std::string& tool, const json& arguments) {
    return connected_client(service)->call_tool(tool, arguments);
}

std::vector<ResourceInfo> ServiceRegistry::list_resources(const std::string& service) {
    return connected_client(service)->list_resources();
}

json ServiceRegistry::read_resource(const std::string& service, const std::string& uri) {
    return connected_client(service)->read_resource(uri);
}

size_t ServiceRegistry::auto_connect_enabled() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, config] : services_) {
            if (config.enabled) {
                names.push_back(name);
            }
        }
    }

    size_t connected = 0;
    for (const auto& name : names) {
        if (connect_service(name)) {
            ++connected;
        }
    }
    spdlog::info("Auto-connected {}/{} enabled service(s)", connected, names.size());
    return connected;
}

json ServiceRegistry::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json status = json::object();
    for (const auto& [name, config] : services_) {
        auto it = clients_.find(name);
        std::shared_ptr<MCPClient> client = it == clients_.end() ? nullptr : it->second;
        std::optional<ServerInfo> info = client ? client->server_info() : std::nullopt;

        status[name] = {
            {"name", name},
            {"description", config.description},
            {"transport", transport_to_string(config.transport)},
            {"endpoint", config.endpoint},
            {"enabled", config.enabled},
            {"connected", client ? client->is_connected() : false},
            {"server_info", info ? json(*info) : json(nullptr)}
        };
    }
    return status;
}

} // namespace mcphub
