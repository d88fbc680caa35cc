#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <curl/curl.h>

namespace mcphub {

/**
 * @brief Full-duplex transport over a WebSocket connection
 *
 * Each text frame carries one JSON-RPC envelope. Built on the libcurl
 * WebSocket API (connect-only mode); fragmented messages are reassembled
 * and pings are answered.
 */
class WebSocketTransport : public ITransport {
public:
    /**
     * @brief Construct WebSocket transport
     * @param config Service configuration (ws:// or wss:// endpoint, headers, auth, timeout)
     */
    explicit WebSocketTransport(const ServiceConfig& config);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void connect() override;
    void disconnect() override;
    std::optional<Message> send(const Message& message) override;
    Message receive() override;
    bool is_connected() const override;
    bool is_full_duplex() const override { return true; }

private:
    /**
     * @brief Send one frame; caller holds io_mutex_
     */
    void send_frame(const std::string& payload, unsigned int flags);

    /**
     * @brief Wait until the socket is readable (or writable) or the timeout elapses
     */
    void wait_socket(bool for_write, int timeout_ms) const;

    std::string endpoint_;
    std::map<std::string, std::string> headers_;
    json auth_;
    long timeout_seconds_;

    CURL* curl_ = nullptr;
    curl_socket_t socket_ = CURL_SOCKET_BAD;
    std::atomic<bool> open_{false};

    std::mutex lifecycle_mutex_;
    std::mutex read_mutex_;     // single reader
    std::mutex io_mutex_;       // guards every call on the easy handle
};

} // namespace mcphub
