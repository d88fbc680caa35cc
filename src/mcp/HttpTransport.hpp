#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <curl/curl.h>

namespace mcphub {

/**
 * @brief Request/response transport POSTing each envelope to an HTTP endpoint
 *
 * Every send() is a full round trip: the reply body (plain JSON, or the
 * first event of a text/event-stream body) is decoded and returned. The
 * server cannot push unsolicited messages, so receive() is unsupported.
 * A session id handed out by the server (Mcp-Session-Id) is sent back on
 * subsequent requests.
 */
class HttpTransport : public ITransport {
public:
    /**
     * @brief Construct HTTP transport
     * @param config Service configuration (endpoint URL, headers, auth, timeout)
     */
    explicit HttpTransport(const ServiceConfig& config);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /**
     * @throws ConnectionError(ProtocolMismatch) if the endpoint is not an http(s) URL
     */
    void connect() override;
    void disconnect() override;

    /**
     * @throws ConnectionError(Unreachable) if the server cannot be reached
     * @throws ConnectionError(ProtocolMismatch) on an HTTP error status without a JSON-RPC body
     * @throws TimeoutError if the round trip exceeds the configured timeout
     */
    std::optional<Message> send(const Message& message) override;

    /**
     * @throws UnsupportedOperation always
     */
    Message receive() override;

    bool is_connected() const override;
    bool is_full_duplex() const override { return false; }

    /**
     * @brief Session id assigned by the server, empty if none
     */
    std::string session_id() const;

    /**
     * @brief Extract the payload of the first message event in an SSE body
     * @return Concatenated data lines, or nullopt if the body has no data event
     */
    static std::optional<std::string> extract_event_data(const std::string& body);

private:
    std::string endpoint_;
    std::map<std::string, std::string> headers_;
    json auth_;
    long timeout_seconds_;

    CURL* curl_ = nullptr;
    std::atomic<bool> connected_{false};
    mutable std::mutex mutex_;    // the easy handle is used by one thread at a time
    std::string session_id_;
};

} // namespace mcphub
