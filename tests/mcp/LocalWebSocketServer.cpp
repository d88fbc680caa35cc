#include "LocalWebSocketServer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcphub {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

LocalWebSocketServer::LocalWebSocketServer(Responder responder)
    : responder_(std::move(responder)) {
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.clear_error_channels(websocketpp::log::elevel::all);
    server_.init_asio();
    server_.set_reuse_addr(true);

    server_.set_open_handler([this](websocketpp::connection_hdl hdl) {
        Server::connection_ptr con = server_.get_con_from_hdl(hdl);
        std::lock_guard<std::mutex> lock(mutex_);
        hdl_ = hdl;
        connected_ = true;
        handshake_headers_.clear();
        for (const auto& [name, value] : con->get_request().get_headers()) {
            handshake_headers_[lower(name)] = value;
        }
        cv_.notify_all();
    });

    server_.set_message_handler([this](websocketpp::connection_hdl hdl, Server::message_ptr message) {
        std::string payload = message->get_payload();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(payload);
        }
        cv_.notify_all();

        if (!responder_) {
            return;
        }
        auto reply = responder_(payload);
        if (reply) {
            websocketpp::lib::error_code ec;
            server_.send(hdl, *reply, websocketpp::frame::opcode::text, ec);
        }
    });

    server_.set_pong_handler([this](websocketpp::connection_hdl, std::string payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pongs_.push_back(payload);
        }
        cv_.notify_all();
    });

    namespace asio = websocketpp::lib::asio;
    server_.listen(asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));

    asio::error_code ec;
    port_ = server_.get_local_endpoint(ec).port();
    if (ec) {
        throw std::runtime_error("Cannot read WebSocket listen port: " + ec.message());
    }

    server_.start_accept();
    thread_ = std::thread([this] { server_.run(); });
}

LocalWebSocketServer::~LocalWebSocketServer() {
    server_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string LocalWebSocketServer::url(const std::string& path) const {
    return "ws://127.0.0.1:" + std::to_string(port_) + path;
}

bool LocalWebSocketServer::wait_for_connection(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return connected_; });
}

bool LocalWebSocketServer::wait_for_received(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count] { return received_.size() >= count; });
}

bool LocalWebSocketServer::wait_for_pong(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !pongs_.empty(); });
}

std::vector<std::string> LocalWebSocketServer::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
}

std::vector<std::string> LocalWebSocketServer::pongs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pongs_;
}

std::map<std::string, std::string> LocalWebSocketServer::handshake_headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handshake_headers_;
}

LocalWebSocketServer::Server::connection_ptr LocalWebSocketServer::connection() {
    websocketpp::connection_hdl hdl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hdl = hdl_;
    }
    return server_.get_con_from_hdl(hdl);
}

void LocalWebSocketServer::send_text(const std::string& payload) {
    connection()->send(payload, websocketpp::frame::opcode::text);
}

void LocalWebSocketServer::send_fragmented(const std::string& payload, size_t split) {
    Server::connection_ptr con = connection();

    auto head = con->get_message(websocketpp::frame::opcode::text, split);
    head->set_payload(payload.substr(0, split));
    head->set_fin(false);
    con->send(head);

    auto tail = con->get_message(websocketpp::frame::opcode::continuation, payload.size() - split);
    tail->set_payload(payload.substr(split));
    tail->set_fin(true);
    con->send(tail);
}

void LocalWebSocketServer::ping(const std::string& payload) {
    connection()->ping(payload);
}

void LocalWebSocketServer::close(const std::string& reason) {
    connection()->close(websocketpp::close::status::normal, reason);
}

} // namespace mcphub
