#pragma once

#include "core/ServiceConfig.hpp"
#include "mcp/Message.hpp"
#include <memory>
#include <optional>

namespace mcphub {

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations move JSON-RPC envelopes over a wire or pipe and know
 * nothing about protocol semantics. Two shapes exist:
 *  - request/response (HTTP): send() performs a round trip and returns the
 *    peer's reply; receive() is unsupported.
 *  - full-duplex (WebSocket, stdio): send() writes a frame and returns
 *    nothing; receive() blocks until the next inbound frame.
 *
 * send() may be called concurrently with a receive() blocked in another
 * thread; implementations must allow that.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Open the underlying connection or process
     * @throws ConnectionError with reason Unreachable or ProtocolMismatch
     */
    virtual void connect() = 0;

    /**
     * @brief Close the connection; a blocked receive() returns with ConnectionError
     *
     * Idempotent: calling it on a closed transport is a no-op.
     */
    virtual void disconnect() = 0;

    /**
     * @brief Send one envelope
     * @param message Envelope to send
     * @return Peer's direct reply on request/response transports, nullopt otherwise
     * @throws ConnectionError if the transport is closed or the write fails
     */
    virtual std::optional<Message> send(const Message& message) = 0;

    /**
     * @brief Block until the next inbound envelope arrives
     * @throws ConnectionError when the transport closes
     * @throws ProtocolViolation for a malformed frame (the transport stays usable)
     * @throws UnsupportedOperation on request/response transports
     */
    virtual Message receive() = 0;

    /**
     * @brief Check if transport is still open
     */
    virtual bool is_connected() const = 0;

    /**
     * @brief True if the peer can push messages independently of sends
     */
    virtual bool is_full_duplex() const = 0;
};

/**
 * @brief Create the transport matching a service's configured kind
 * @param config Service configuration (transport, endpoint, headers, ...)
 */
std::unique_ptr<ITransport> make_transport(const ServiceConfig& config);

} // namespace mcphub
