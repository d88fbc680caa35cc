#pragma once

#include "core/ServiceConfig.hpp"
#include "mcp/Errors.hpp"
#include "mcp/ITransport.hpp"
#include "mcp/Message.hpp"
#include "mcp/Types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcphub {

/**
 * @brief Connection lifecycle of a client
 *
 * Disconnected -> Connecting -> Handshaking -> Ready -> Disconnected.
 * Failed is entered from Connecting/Handshaking when the attempt fails;
 * it behaves like Disconnected and last_error() tells why.
 */
enum class ClientState {
    Disconnected,
    Connecting,
    Handshaking,
    Ready,
    Failed
};

std::string to_string(ClientState state);

/**
 * @brief Callback for notifications pushed by the server
 *
 * Runs on the receive thread; it must not call disconnect() on the client.
 */
using NotificationHandler = std::function<void(const Notification&)>;

/**
 * @brief MCP client for one remote service
 *
 * Owns one transport, performs the initialize handshake and correlates
 * responses to requests by id. On full-duplex transports a dedicated
 * receive thread is the only reader of the transport and the only party
 * that resolves pending requests; callers only write. Concurrent
 * send_request() calls from several threads are safe and each gets the
 * response carrying its own id, whatever the arrival order.
 */
class MCPClient {
public:
    /**
     * @brief Construct client using the transport selected by config.transport
     * @param config Service configuration
     * @param client_info Identity announced in the handshake
     */
    explicit MCPClient(ServiceConfig config, ClientInfo client_info = default_client_info());

    /**
     * @brief Construct client over an explicit transport
     * @param config Service configuration (name and timeout are used)
     * @param transport Transport implementation, must not be null
     * @param client_info Identity announced in the handshake
     */
    MCPClient(ServiceConfig config,
              std::unique_ptr<ITransport> transport,
              ClientInfo client_info = default_client_info());

    ~MCPClient();

    MCPClient(const MCPClient&) = delete;
    MCPClient& operator=(const MCPClient&) = delete;

    /**
     * @brief Open the transport and perform the handshake
     *
     * No-op when already Ready.
     * @throws ConnectionError if the transport cannot be opened
     * @throws HandshakeError if the peer rejects or does not answer initialize
     */
    void connect();

    /**
     * @brief Stop the receive thread, close the transport and fail all pending requests
     *
     * Outstanding requests fail with ConnectionError(Closed). Idempotent.
     */
    void disconnect();

    ClientState state() const;

    /**
     * @brief True when Ready and the transport is still open
     */
    bool is_connected() const;

    /**
     * @brief Description of the failure that led to Failed (or a dropped connection)
     */
    std::string last_error() const;

    /**
     * @brief Server identity from the handshake, empty when not connected
     */
    std::optional<ServerInfo> server_info() const;

    const ServiceConfig& config() const { return config_; }
    const std::string& name() const { return config_.name; }

    /**
     * @brief Send a request and wait for its correlated response
     * @param method JSON-RPC method name
     * @param params Optional parameters
     * @return Response (which may carry an error object)
     * @throws TimeoutError if no response arrives within the request timeout
     * @throws ConnectionError if the send fails or the connection closes while waiting
     * @throws ProtocolViolation if params cannot be encoded (e.g. invalid UTF-8)
     */
    Response send_request(const std::string& method, std::optional<json> params = std::nullopt);

    /**
     * @brief Send a notification (fire-and-forget)
     * @throws ConnectionError if the transport send fails
     */
    void send_notification(const std::string& method, std::optional<json> params = std::nullopt);

    /**
     * @brief Fetch all tools (follows nextCursor pagination)
     * @throws ToolInvocationError if the server answers with an error
     */
    std::vector<ToolInfo> list_tools();

    /**
     * @brief Invoke a tool
     * @return The result object exactly as returned by the server
     * @throws ToolInvocationError carrying the server's error object
     */
    json call_tool(const std::string& name, const json& arguments);

    /**
     * @throws ResourceError if the server answers with an error
     */
    std::vector<ResourceInfo> list_resources();

    /**
     * @brief Read a resource by URI
     * @return The result object exactly as returned by the server
     * @throws ResourceError carrying the server's error object
     */
    json read_resource(const std::string& uri);

    /**
     * @throws PeerError if the server answers with an error
     */
    std::vector<PromptInfo> list_prompts();

    /**
     * @brief Liveness check; succeeds when the server answers the ping
     */
    void ping();

    void set_notification_handler(NotificationHandler handler);

    /**
     * @brief Override the per-request timeout (defaults to config.timeout_seconds)
     */
    void set_request_timeout(std::chrono::milliseconds timeout);

    /**
     * @brief Number of requests currently awaiting a response
     */
    size_t pending_count() const;

    static ClientInfo default_client_info();

private:
    void handshake();
    void teardown(const std::string& reason);
    void receive_loop();
    void dispatch(Message message);
    void resolve(const Response& response);
    void handle_server_request(const Request& request);
    void fail_pending(const std::string& reason);
    bool forget_pending(const std::string& id);
    void set_state(ClientState state);

    /**
     * @brief Run a list method across all pages and collect the named array
     */
    template <typename T, typename Error>
    std::vector<T> collect_pages(const std::string& method, const std::string& key);

    ServiceConfig config_;
    ClientInfo client_info_;
    std::unique_ptr<ITransport> transport_;
    std::atomic<std::chrono::milliseconds::rep> request_timeout_ms_;

    std::mutex lifecycle_mutex_;            // serializes connect/disconnect

    mutable std::mutex state_mutex_;
    ClientState state_ = ClientState::Disconnected;
    std::optional<ServerInfo> server_info_;
    std::string last_error_;

    mutable std::mutex pending_mutex_;
    std::uint64_t next_id_ = 1;             // never reused, even across reconnects
    std::map<std::string, std::promise<Response>> pending_;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;

    std::thread receive_thread_;
    std::atomic<bool> stopping_{false};
};

} // namespace mcphub
