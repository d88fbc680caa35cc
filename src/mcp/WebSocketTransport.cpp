#include "WebSocketTransport.hpp"
#include "CurlSupport.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <vector>
#include <curl/websockets.h>
#include <poll.h>

namespace mcphub {

namespace {

constexpr int POLL_INTERVAL_MS = 100;

} // namespace

WebSocketTransport::WebSocketTransport(const ServiceConfig& config)
    : endpoint_(config.endpoint),
      headers_(config.headers.value_or(std::map<std::string, std::string>{})),
      auth_(config.auth.value_or(json())),
      timeout_seconds_(config.timeout_seconds > 0 ? config.timeout_seconds : 30) {
    spdlog::debug("WebSocketTransport initialized for {}", endpoint_);
}

WebSocketTransport::~WebSocketTransport() {
    disconnect();
}

void WebSocketTransport::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (open_) {
        return;
    }

    auto sep = endpoint_.find("://");
    std::string scheme = sep == std::string::npos ? std::string() : endpoint_.substr(0, sep);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "ws" && scheme != "wss") {
        throw ConnectionError(ConnectionError::Reason::ProtocolMismatch,
                              "Not a WebSocket endpoint: " + endpoint_);
    }

    ensure_curl_global_init();
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ConnectionError(ConnectionError::Reason::Unreachable,
                              "Failed to initialize WebSocket handle");
    }

    CurlSlistPtr headers;
    for (const auto& [name, value] : headers_) {
        append_header(headers, name + ": " + value);
    }
    if (auth_.is_object() && auth_.contains("token") && auth_["token"].is_string()) {
        append_header(headers, "Authorization: Bearer " + auth_["token"].get<std::string>());
    }

    std::vector<char> errbuf(CURL_ERROR_SIZE, '\0');
    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf.data());
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        ConnectionError error = connection_error_from(code, errbuf.data());
        curl_easy_cleanup(curl);
        throw error;
    }

    curl_socket_t sockfd = CURL_SOCKET_BAD;
    code = curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sockfd);
    if (code != CURLE_OK || sockfd == CURL_SOCKET_BAD) {
        curl_easy_cleanup(curl);
        throw ConnectionError(ConnectionError::Reason::Unreachable,
                              "WebSocket connected without a usable socket");
    }

    // The handle keeps referencing the error buffer; stop that before it goes away
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);

    {
        std::lock_guard<std::mutex> io_lock(io_mutex_);
        curl_ = curl;
        socket_ = sockfd;
    }
    open_ = true;
    spdlog::info("WebSocket connected to {}", endpoint_);
}

void WebSocketTransport::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    bool was_open = open_.exchange(false);

    // A blocked reader notices the flag within one poll interval
    std::lock_guard<std::mutex> read_lock(read_mutex_);
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    if (!curl_) {
        return;
    }

    if (was_open) {
        try {
            send_frame(std::string(), CURLWS_CLOSE);
        } catch (const ConnectionError& e) {
            spdlog::debug("WebSocket close frame not sent: {}", e.what());
        }
    }

    curl_easy_cleanup(curl_);
    curl_ = nullptr;
    socket_ = CURL_SOCKET_BAD;
    spdlog::debug("WebSocketTransport disconnected");
}

void WebSocketTransport::wait_socket(bool for_write, int timeout_ms) const {
    pollfd pfd{};
    pfd.fd = socket_;
    pfd.events = for_write ? POLLOUT : POLLIN;
    poll(&pfd, 1, timeout_ms);
}

void WebSocketTransport::send_frame(const std::string& payload, unsigned int flags) {
    if (!curl_) {
        throw ConnectionError(ConnectionError::Reason::NotConnected, "WebSocket not connected");
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds_);
    while (true) {
        size_t sent = 0;
        CURLcode code = curl_ws_send(curl_, payload.data(), payload.size(), &sent, 0, flags);
        if (code == CURLE_OK) {
            return;
        }
        if (code != CURLE_AGAIN) {
            throw connection_error_from(code, nullptr);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ConnectionError(ConnectionError::Reason::Closed, "WebSocket send stalled");
        }
        wait_socket(true, POLL_INTERVAL_MS);
    }
}

std::optional<Message> WebSocketTransport::send(const Message& message) {
    std::string serialized = message.to_json().dump();

    std::lock_guard<std::mutex> io_lock(io_mutex_);
    if (!open_) {
        throw ConnectionError(ConnectionError::Reason::NotConnected, "WebSocket not connected");
    }
    send_frame(serialized, CURLWS_TEXT);
    spdlog::debug("Wrote frame: {}", serialized);
    return std::nullopt;
}

Message WebSocketTransport::receive() {
    std::lock_guard<std::mutex> read_lock(read_mutex_);

    std::string frame;
    std::array<char, 8192> buffer{};

    while (true) {
        if (!open_) {
            throw ConnectionError(ConnectionError::Reason::Closed, "WebSocket closed");
        }

        size_t received = 0;
        curl_ws_frame* meta = nullptr;
        CURLcode code;
        {
            std::lock_guard<std::mutex> io_lock(io_mutex_);
            if (!curl_) {
                throw ConnectionError(ConnectionError::Reason::Closed, "WebSocket closed");
            }
            code = curl_ws_recv(curl_, buffer.data(), buffer.size(), &received, &meta);
        }

        if (code == CURLE_AGAIN) {
            wait_socket(false, POLL_INTERVAL_MS);
            continue;
        }
        if (code != CURLE_OK || !meta) {
            open_ = false;
            ConnectionError error = connection_error_from(code, nullptr);
            throw ConnectionError(ConnectionError::Reason::Closed,
                                  std::string("WebSocket receive failed: ") + error.what());
        }

        if (meta->flags & CURLWS_CLOSE) {
            open_ = false;
            throw ConnectionError(ConnectionError::Reason::Closed, "WebSocket closed by peer");
        }
        if (meta->flags & CURLWS_PING) {
            std::string payload(buffer.data(), received);
            std::lock_guard<std::mutex> io_lock(io_mutex_);
            send_frame(payload, CURLWS_PONG);
            continue;
        }
        if (meta->flags & CURLWS_PONG) {
            continue;
        }

        frame.append(buffer.data(), received);
        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            if (frame.empty()) {
                continue;
            }
            spdlog::debug("Read frame: {}", frame);
            return Message::decode(frame);
        }
    }
}

bool WebSocketTransport::is_connected() const {
    return open_;
}

} // namespace mcphub
