#include "MCPClient.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

#ifndef MCPHUB_VERSION
#define MCPHUB_VERSION "0.0.0"
#endif

namespace mcphub {

namespace {

// Upper bound on list pages, guards against a server that keeps returning a cursor
constexpr int MAX_LIST_PAGES = 64;

constexpr int METHOD_NOT_FOUND = -32601;

class PromptError : public PeerError {
public:
    explicit PromptError(json error)
        : PeerError("Prompt request failed", std::move(error)) {}
};

} // namespace

std::string to_string(ClientState state) {
    switch (state) {
        case ClientState::Disconnected: return "disconnected";
        case ClientState::Connecting:   return "connecting";
        case ClientState::Handshaking:  return "handshaking";
        case ClientState::Ready:        return "ready";
        case ClientState::Failed:       return "failed";
    }
    return "unknown";
}

ClientInfo MCPClient::default_client_info() {
    return ClientInfo{"mcphub", MCPHUB_VERSION};
}

MCPClient::MCPClient(ServiceConfig config, ClientInfo client_info)
    : MCPClient(config, make_transport(config), std::move(client_info)) {}

MCPClient::MCPClient(ServiceConfig config,
                     std::unique_ptr<ITransport> transport,
                     ClientInfo client_info)
    : config_(std::move(config)),
      client_info_(std::move(client_info)),
      transport_(std::move(transport)),
      request_timeout_ms_((config_.timeout_seconds > 0 ? config_.timeout_seconds : 30) * 1000) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::debug("MCPClient created for service {}", config_.name);
}

MCPClient::~MCPClient() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        spdlog::error("Error while closing client {}: {}", config_.name, e.what());
    }
}

void MCPClient::set_state(ClientState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

ClientState MCPClient::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool MCPClient::is_connected() const {
    return state() == ClientState::Ready && transport_->is_connected();
}

std::string MCPClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

std::optional<ServerInfo> MCPClient::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

void MCPClient::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void MCPClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ms_ = timeout.count();
}

size_t MCPClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void MCPClient::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state() == ClientState::Ready && transport_->is_connected()) {
        return;
    }

    // Leftovers of a dropped session (reader thread already finished)
    teardown("Connection reset");

    spdlog::info("Connecting to MCP server: {}", config_.name);
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        state_ = ClientState::Connecting;
        last_error_.clear();
    }

    auto fail = [this](const std::string& reason) {
        teardown(reason);
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        state_ = ClientState::Failed;
        last_error_ = reason;
    };

    try {
        transport_->connect();
    } catch (const ConnectionError& e) {
        fail(e.what());
        spdlog::error("Failed to open transport for {}: {}", config_.name, e.what());
        throw;
    } catch (const std::exception& e) {
        fail(e.what());
        spdlog::error("Failed to open transport for {}: {}", config_.name, e.what());
        throw ConnectionError(ConnectionError::Reason::Unreachable, e.what());
    }

    set_state(ClientState::Handshaking);
    stopping_ = false;
    if (transport_->is_full_duplex()) {
        receive_thread_ = std::thread(&MCPClient::receive_loop, this);
    }

    try {
        handshake();
    } catch (const HandshakeError& e) {
        fail(e.what());
        spdlog::error("Handshake with {} failed: {}", config_.name, e.what());
        throw;
    } catch (const ConnectionError& e) {
        fail(e.what());
        spdlog::error("Connection to {} lost during handshake: {}", config_.name, e.what());
        throw;
    } catch (const MCPError& e) {
        fail(e.what());
        spdlog::error("Handshake with {} failed: {}", config_.name, e.what());
        throw HandshakeError(e.what());
    }
}

void MCPClient::handshake() {
    json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", {
            {"tools", json::object()},
            {"resources", json::object()},
            {"prompts", json::object()}
        }},
        {"clientInfo", {
            {"name", client_info_.name},
            {"version", client_info_.version}
        }}
    };

    Response response;
    try {
        response = send_request("initialize", params);
    } catch (const TimeoutError&) {
        throw HandshakeError("Initialize timed out for " + config_.name, true);
    }

    if (response.is_error()) {
        throw HandshakeError("Initialize rejected: " + response.error->dump());
    }
    if (!response.result || !response.result->is_object()) {
        throw HandshakeError("Initialize result is not an object");
    }

    const json& result = *response.result;
    ServerInfo info;
    try {
        if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
            info = result["serverInfo"].get<ServerInfo>();
        }
        if (result.contains("protocolVersion") && result["protocolVersion"].is_string()) {
            info.protocol_version = result["protocolVersion"].get<std::string>();
        }
        if (result.contains("capabilities") && result["capabilities"].is_object()) {
            info.capabilities = result["capabilities"];
        }
    } catch (const json::exception& e) {
        throw HandshakeError(std::string("Malformed initialize result: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server_info_ = info;
        state_ = ClientState::Ready;
    }
    spdlog::info("Connected to {} ({} {}, protocol {})",
                 config_.name, info.name, info.version, info.protocol_version);

    try {
        send_notification("notifications/initialized");
    } catch (const MCPError& e) {
        spdlog::warn("Failed to send initialized notification to {}: {}", config_.name, e.what());
    }
}

void MCPClient::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    bool was_ready = state() == ClientState::Ready;

    teardown("Connection closed");
    set_state(ClientState::Disconnected);

    if (was_ready) {
        spdlog::info("Disconnected from MCP server: {}", config_.name);
    }
}

void MCPClient::teardown(const std::string& reason) {
    stopping_ = true;
    transport_->disconnect();
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }
    fail_pending(reason);

    std::lock_guard<std::mutex> lock(state_mutex_);
    server_info_.reset();
}

void MCPClient::fail_pending(const std::string& reason) {
    std::map<std::string, std::promise<Response>> orphaned;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        orphaned.swap(pending_);
    }
    for (auto& [id, promise] : orphaned) {
        promise.set_exception(std::make_exception_ptr(
            ConnectionError(ConnectionError::Reason::Closed, reason)));
    }
    if (!orphaned.empty()) {
        spdlog::debug("Failed {} pending request(s) on {}: {}", orphaned.size(), config_.name, reason);
    }
}

bool MCPClient::forget_pending(const std::string& id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.erase(id) > 0;
}

Response MCPClient::send_request(const std::string& method, std::optional<json> params) {
    ClientState current = state();
    if (current != ClientState::Ready && current != ClientState::Handshaking) {
        throw ConnectionError(ConnectionError::Reason::NotConnected,
                              "Service not connected: " + config_.name);
    }

    std::string id;
    std::future<Response> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        id = std::to_string(next_id_++);
        future = pending_[id].get_future();
    }

    spdlog::debug("-> {} [{}] {}", config_.name, id, method);

    std::optional<Message> reply;
    try {
        reply = transport_->send(Request{id, method, std::move(params)});
    } catch (const MCPError&) {
        forget_pending(id);
        throw;
    } catch (const json::exception& e) {
        forget_pending(id);
        throw ProtocolViolation("Cannot encode " + method + " request: " + e.what());
    }

    if (!transport_->is_full_duplex()) {
        // Request/response transport: the reply is the only chance to resolve
        if (reply) {
            dispatch(std::move(*reply));
        }
        if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            forget_pending(id);
            throw ProtocolViolation("No response correlated to " + method + " [" + id + "]");
        }
        return future.get();
    }

    if (reply) {
        dispatch(std::move(*reply));
    }

    auto timeout = std::chrono::milliseconds(request_timeout_ms_.load());
    if (future.wait_for(timeout) != std::future_status::ready) {
        if (forget_pending(id)) {
            spdlog::warn("Request {} [{}] to {} timed out", method, id, config_.name);
            throw TimeoutError(method);
        }
        // Resolved between the wait and the removal; the value is on its way
    }
    return future.get();
}

void MCPClient::send_notification(const std::string& method, std::optional<json> params) {
    try {
        transport_->send(Notification{method, std::move(params)});
    } catch (const json::exception& e) {
        throw ProtocolViolation("Cannot encode " + method + " notification: " + e.what());
    }
}

void MCPClient::receive_loop() {
    spdlog::debug("Receive loop started for {}", config_.name);

    while (!stopping_) {
        try {
            dispatch(transport_->receive());
        } catch (const ProtocolViolation& e) {
            spdlog::warn("Discarding frame from {}: {}", config_.name, e.what());
        } catch (const ConnectionError& e) {
            if (!stopping_) {
                spdlog::warn("Connection to {} lost: {}", config_.name, e.what());
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    state_ = ClientState::Disconnected;
                    server_info_.reset();
                    last_error_ = e.what();
                }
                fail_pending(e.what());
            }
            break;
        } catch (const std::exception& e) {
            spdlog::error("Receive loop for {} stopped: {}", config_.name, e.what());
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_ = ClientState::Disconnected;
                server_info_.reset();
                last_error_ = e.what();
            }
            fail_pending(e.what());
            break;
        }
    }

    spdlog::debug("Receive loop stopped for {}", config_.name);
}

void MCPClient::dispatch(Message message) {
    switch (message.kind()) {
        case Message::Kind::Response:
            resolve(message.response());
            break;

        case Message::Kind::Notification: {
            NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = notification_handler_;
            }
            const Notification& notification = message.notification();
            if (!handler) {
                spdlog::debug("Unhandled notification from {}: {}", config_.name, notification.method);
                break;
            }
            try {
                handler(notification);
            } catch (const std::exception& e) {
                spdlog::error("Notification handler for {} failed: {}", notification.method, e.what());
            }
            break;
        }

        case Message::Kind::Request:
            handle_server_request(message.request());
            break;
    }
}

void MCPClient::resolve(const Response& response) {
    std::promise<Response> promise;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(response.id);
        if (it == pending_.end()) {
            spdlog::warn("Dropping response from {} with unknown id '{}'", config_.name, response.id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    spdlog::debug("<- {} [{}]{}", config_.name, response.id, response.is_error() ? " error" : "");
    promise.set_value(response);
}

void MCPClient::handle_server_request(const Request& request) {
    Response reply = request.method == "ping"
        ? Response::success(request.id, json::object())
        : Response::failure(request.id, METHOD_NOT_FOUND, "Method not supported: " + request.method);

    if (reply.is_error()) {
        spdlog::debug("Rejecting server request {} from {}", request.method, config_.name);
    }

    try {
        transport_->send(reply);
    } catch (const MCPError& e) {
        spdlog::warn("Failed to answer server request {}: {}", request.method, e.what());
    }
}

template <typename T, typename Error>
std::vector<T> MCPClient::collect_pages(const std::string& method, const std::string& key) {
    std::vector<T> items;
    std::optional<std::string> cursor;

    for (int page = 0; page < MAX_LIST_PAGES; ++page) {
        std::optional<json> params;
        if (cursor) {
            params = json{{"cursor", *cursor}};
        }

        Response response = send_request(method, params);
        if (response.is_error()) {
            throw Error(*response.error);
        }
        if (!response.result || !response.result->is_object()) {
            break;
        }

        const json& result = *response.result;
        if (result.contains(key) && result[key].is_array()) {
            for (const auto& entry : result[key]) {
                try {
                    items.push_back(entry.get<T>());
                } catch (const json::exception& e) {
                    spdlog::warn("Skipping malformed {} entry from {}: {}", key, config_.name, e.what());
                }
            }
        }

        if (!result.contains("nextCursor") || !result["nextCursor"].is_string()) {
            break;
        }
        cursor = result["nextCursor"].get<std::string>();
    }

    return items;
}

std::vector<ToolInfo> MCPClient::list_tools() {
    return collect_pages<ToolInfo, ToolInvocationError>("tools/list", "tools");
}

json MCPClient::call_tool(const std::string& name, const json& arguments) {
    Response response = send_request("tools/call", json{{"name", name}, {"arguments", arguments}});
    if (response.is_error()) {
        throw ToolInvocationError(*response.error);
    }
    return response.result.value_or(json::object());
}

std::vector<ResourceInfo> MCPClient::list_resources() {
    return collect_pages<ResourceInfo, ResourceError>("resources/list", "resources");
}

json MCPClient::read_resource(const std::string& uri) {
    Response response = send_request("resources/read", json{{"uri", uri}});
    if (response.is_error()) {
        throw ResourceError(*response.error);
    }
    return response.result.value_or(json::object());
}

std::vector<PromptInfo> MCPClient::list_prompts() {
    return collect_pages<PromptInfo, PromptError>("prompts/list", "prompts");
}

void MCPClient::ping() {
    Response response = send_request("ping");
    if (response.is_error()) {
        throw PeerError("Ping failed", *response.error);
    }
}

} // namespace mcphub
