#include "ITransport.hpp"
#include "HttpTransport.hpp"
#include "StdioTransport.hpp"
#include "WebSocketTransport.hpp"

namespace mcphub {

std::unique_ptr<ITransport> make_transport(const ServiceConfig& config) {
    switch (config.transport) {
        case TransportType::Http:
            return std::make_unique<HttpTransport>(config);
        case TransportType::WebSocket:
            return std::make_unique<WebSocketTransport>(config);
        case TransportType::Stdio:
            return std::make_unique<StdioTransport>(config);
    }
    throw std::invalid_argument("Unsupported transport for service " + config.name);
}

} // namespace mcphub
