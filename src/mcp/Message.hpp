#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcphub {

using json = nlohmann::json;

constexpr const char* JSONRPC_VERSION = "2.0";

/**
 * @brief Call expecting a Response with the same id
 */
struct Request {
    std::string id;
    std::string method;
    std::optional<json> params;
};

/**
 * @brief Reply to a Request; exactly one of result / error is set
 */
struct Response {
    std::string id;
    std::optional<json> result;
    std::optional<json> error;

    bool is_error() const { return error.has_value(); }

    static Response success(std::string id, json result);
    static Response failure(std::string id, int code, const std::string& message);
};

/**
 * @brief One-way message, no Response expected
 */
struct Notification {
    std::string method;
    std::optional<json> params;
};

/**
 * @brief One JSON-RPC 2.0 envelope
 *
 * Tagged union of Request, Response and Notification. Parsing classifies
 * structurally: result/error present means Response, method with id means
 * Request, method without id means Notification.
 */
class Message {
public:
    enum class Kind {
        Request,
        Response,
        Notification
    };

    Message(Request request) : body_(std::move(request)) {}
    Message(Response response) : body_(std::move(response)) {}
    Message(Notification notification) : body_(std::move(notification)) {}

    Kind kind() const;

    bool is_request() const { return kind() == Kind::Request; }
    bool is_response() const { return kind() == Kind::Response; }
    bool is_notification() const { return kind() == Kind::Notification; }

    /**
     * @throws std::bad_variant_access if the message is of another kind
     */
    const Request& request() const { return std::get<Request>(body_); }
    const Response& response() const { return std::get<Response>(body_); }
    const Notification& notification() const { return std::get<Notification>(body_); }

    /**
     * @brief Method name for requests and notifications, empty for responses
     */
    std::string method() const;

    /**
     * @brief Serialize to JSON-RPC 2.0 wire form
     */
    json to_json() const;

    /**
     * @brief Classify and decode a JSON value
     * @throws ProtocolViolation if the value is not a valid envelope
     */
    static Message parse(const json& value);

    /**
     * @brief Decode a serialized frame
     * @throws ProtocolViolation on invalid JSON or invalid envelope
     */
    static Message decode(const std::string& text);

private:
    std::variant<Request, Response, Notification> body_;
};

/**
 * @brief Normalize a JSON-RPC id to the string form used for correlation
 *
 * Strings are kept, integers become their decimal text, null becomes empty.
 * @throws ProtocolViolation for any other id type
 */
std::string normalize_id(const json& id);

} // namespace mcphub
