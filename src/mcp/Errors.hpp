#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace mcphub {

using json = nlohmann::json;

/**
 * @brief Base class of all protocol client failures
 */
class MCPError : public std::runtime_error {
public:
    explicit MCPError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Transport unreachable, closed, or not usable for this protocol
 */
class ConnectionError : public MCPError {
public:
    enum class Reason {
        Unreachable,        // peer or process could not be reached
        ProtocolMismatch,   // peer reached but speaks something else
        Closed,             // connection closed or dropped
        NotConnected        // operation attempted without a connection
    };

    ConnectionError(Reason reason, const std::string& message)
        : MCPError(message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

/**
 * @brief Peer rejected the initialize exchange or it did not complete
 */
class HandshakeError : public MCPError {
public:
    /**
     * @param message Failure description
     * @param transient true when the handshake timed out rather than being rejected
     */
    explicit HandshakeError(const std::string& message, bool transient = false)
        : MCPError(message), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

/**
 * @brief No correlated response arrived within the configured window
 */
class TimeoutError : public MCPError {
public:
    explicit TimeoutError(const std::string& method)
        : MCPError("Request timeout: " + method), method_(method) {}

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

/**
 * @brief Malformed envelope or response that matches no outstanding request
 */
class ProtocolViolation : public MCPError {
public:
    explicit ProtocolViolation(const std::string& message)
        : MCPError("Protocol violation: " + message) {}
};

/**
 * @brief Operation not available on this transport
 */
class UnsupportedOperation : public MCPError {
public:
    explicit UnsupportedOperation(const std::string& message)
        : MCPError(message) {}
};

/**
 * @brief Peer answered a call with a JSON-RPC error object
 *
 * The error object is kept exactly as the peer sent it.
 */
class PeerError : public MCPError {
public:
    PeerError(const std::string& prefix, json error)
        : MCPError(prefix + ": " + describe(error)), error_(std::move(error)) {}

    const json& error() const { return error_; }

private:
    static std::string describe(const json& error) {
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        return error.dump();
    }

    json error_;
};

class ToolInvocationError : public PeerError {
public:
    explicit ToolInvocationError(json error)
        : PeerError("Tool call failed", std::move(error)) {}
};

class ResourceError : public PeerError {
public:
    explicit ResourceError(json error)
        : PeerError("Resource request failed", std::move(error)) {}
};

} // namespace mcphub
