#pragma once

#include "core/ConfigStore.hpp"
#include "core/ServiceConfig.hpp"
#include "mcp/MCPClient.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

using TransportFactory = std::function<std::unique_ptr<ITransport>(const ServiceConfig&)>;

/**
 * @brief Tuning knobs for a ServiceRegistry
 */
struct RegistryOptions {
    std::filesystem::path config_dir = default_config_dir();
    std::chrono::milliseconds backoff_base{500};   // delay after the first failed attempt
    std::chrono::milliseconds backoff_cap{5000};
    ClientInfo client_info = MCPClient::default_client_info();
    TransportFactory transport_factory;            // empty selects make_transport

    /**
     * @brief $MCPHUB_CONFIG_DIR, else $HOME/.mcphub/mcp, else ./.mcphub/mcp
     */
    static std::filesystem::path default_config_dir();
};

/**
 * @brief Owns configured services and their live clients
 *
 * Holds the authoritative mapping from service name to ServiceConfig
 * (persisted through ConfigStore) and to at most one MCPClient. Connect,
 * disconnect, update and remove are serialized by one lifecycle mutex, so
 * concurrent connects for one name never produce two clients.
 */
class ServiceRegistry {
public:
    explicit ServiceRegistry(RegistryOptions options = RegistryOptions());
    ~ServiceRegistry();

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /**
     * @brief Load every record from the config directory
     *
     * Replaces the in-memory set with what is on disk; clients of services
     * whose records disappeared are disconnected. Unreadable records are
     * skipped with an error log. An empty or absent directory is created and
     * seeded with a disabled example service.
     * @return Number of services loaded (including the seed)
     */
    size_t load_services();

    /**
     * @brief Add or replace a service and persist it
     *
     * A live client for the same name is disconnected so the next connect
     * picks up the new settings.
     * @throws std::invalid_argument if the name or endpoint is empty
     * @throws std::runtime_error if the record cannot be written
     */
    void add_service(const ServiceConfig& config);

    /**
     * @brief Replace an existing service
     * @return false if no service with that name exists
     */
    bool update_service(const ServiceConfig& config);

    /**
     * @brief Remove a service, its record file and its client
     * @return false if the name is unknown
     * @throws std::runtime_error if the record file cannot be deleted; the
     *         service is then left registered
     */
    bool remove_service(const std::string& name);

    std::vector<ServiceConfig> list_services() const;
    std::optional<ServiceConfig> get_service(const std::string& name) const;

    /**
     * @brief Connect a service, retrying transient failures with backoff
     *
     * Never throws for connection failures; they are logged.
     * @return true if the service has a ready client afterwards
     */
    bool connect_service(const std::string& name);

    /**
     * @brief Cause of the last failed connect_service for a name, empty after success
     */
    std::string connect_error(const std::string& name) const;

    void disconnect_service(const std::string& name);
    void disconnect_all();

    /**
     * @brief Live client for a service, null if none
     */
    std::shared_ptr<MCPClient> get_client(const std::string& name) const;

    /**
     * @brief Tools of every connected service; a failing service maps to an empty list
     */
    std::map<std::string, std::vector<ToolInfo>> list_all_tools();

    /**
     * @brief Call a tool on a connected service
     * @throws ConnectionError(NotConnected) if the service has no ready client
     * @throws ToolInvocationError with the peer's error object
     */
    json call_tool(const std::string& service, const std::string& tool, const json& arguments);

    /**
     * @throws ConnectionError(NotConnected) if the service has no ready client
     * @throws ResourceError with the peer's error object
     */
    std::vector<ResourceInfo> list_resources(const std::string& service);
    json read_resource(const std::string& service, const std::string& uri);

    /**
     * @brief Connect every enabled service, continuing past failures
     * @return Number of services connected
     */
    size_t auto_connect_enabled();

    /**
     * @brief Snapshot: name -> {name, description, transport, endpoint, enabled, connected, server_info}
     */
    json get_status() const;

    const ConfigStore& store() const { return store_; }

    /**
     * @brief Record written when the config directory is empty
     */
    static ServiceConfig example_service();

private:
    std::shared_ptr<MCPClient> connected_client(const std::string& name) const;
    std::shared_ptr<MCPClient> take_client(const std::string& name);
    std::chrono::milliseconds backoff_delay(int attempt) const;

    RegistryOptions options_;
    ConfigStore store_;

    std::mutex lifecycle_mutex_;        // connect/disconnect/update/remove
    mutable std::mutex mutex_;          // guards the maps below
    std::map<std::string, ServiceConfig> services_;
    std::map<std::string, std::shared_ptr<MCPClient>> clients_;
    std::map<std::string, std::string> connect_errors_;
};

} // namespace mcphub
