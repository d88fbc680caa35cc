#include "Message.hpp"
#include "Errors.hpp"

namespace mcphub {

Response Response::success(std::string id, json result) {
    Response response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

Response Response::failure(std::string id, int code, const std::string& message) {
    Response response;
    response.id = std::move(id);
    response.error = json{
        {"code", code},
        {"message", message}
    };
    return response;
}

Message::Kind Message::kind() const {
    switch (body_.index()) {
        case 0:
            return Kind::Request;
        case 1:
            return Kind::Response;
        default:
            return Kind::Notification;
    }
}

std::string Message::method() const {
    if (auto* request = std::get_if<Request>(&body_)) {
        return request->method;
    }
    if (auto* notification = std::get_if<Notification>(&body_)) {
        return notification->method;
    }
    return {};
}

json Message::to_json() const {
    json out = {{"jsonrpc", JSONRPC_VERSION}};

    switch (kind()) {
        case Kind::Request: {
            const auto& request = std::get<Request>(body_);
            out["id"] = request.id;
            out["method"] = request.method;
            if (request.params) {
                out["params"] = *request.params;
            }
            break;
        }
        case Kind::Response: {
            const auto& response = std::get<Response>(body_);
            out["id"] = response.id;
            if (response.error) {
                out["error"] = *response.error;
            } else {
                out["result"] = response.result ? *response.result : json::object();
            }
            break;
        }
        case Kind::Notification: {
            const auto& notification = std::get<Notification>(body_);
            out["method"] = notification.method;
            if (notification.params) {
                out["params"] = *notification.params;
            }
            break;
        }
    }

    return out;
}

std::string normalize_id(const json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_number_integer()) {
        return std::to_string(id.get<long long>());
    }
    if (id.is_number_unsigned()) {
        return std::to_string(id.get<unsigned long long>());
    }
    if (id.is_null()) {
        return {};
    }
    throw ProtocolViolation("invalid id type: " + id.dump());
}

Message Message::parse(const json& value) {
    if (!value.is_object()) {
        throw ProtocolViolation("envelope is not an object");
    }

    if (value.contains("jsonrpc") && value["jsonrpc"] != JSONRPC_VERSION) {
        throw ProtocolViolation("unsupported jsonrpc version " + value["jsonrpc"].dump());
    }

    bool has_result = value.contains("result");
    bool has_error = value.contains("error");
    bool has_id = value.contains("id") && !value["id"].is_null();

    if (has_result || has_error) {
        if (has_result && has_error) {
            throw ProtocolViolation("response carries both result and error");
        }
        if (!value.contains("id")) {
            throw ProtocolViolation("response without id");
        }

        Response response;
        response.id = normalize_id(value["id"]);
        if (has_result) {
            response.result = value["result"];
        } else {
            response.error = value["error"];
        }
        return Message(std::move(response));
    }

    if (!value.contains("method") || !value["method"].is_string()) {
        throw ProtocolViolation("envelope has neither method nor result/error");
    }

    std::string method = value["method"].get<std::string>();
    std::optional<json> params;
    if (value.contains("params") && !value["params"].is_null()) {
        params = value["params"];
    }

    if (has_id) {
        return Message(Request{normalize_id(value["id"]), std::move(method), std::move(params)});
    }
    return Message(Notification{std::move(method), std::move(params)});
}

Message Message::decode(const std::string& text) {
    json value;
    try {
        value = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolViolation(std::string("invalid JSON: ") + e.what());
    }
    return parse(value);
}

} // namespace mcphub
