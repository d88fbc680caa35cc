#include "mcp/Message.hpp"
#include "mcp/Errors.hpp"
#include "mcp/Types.hpp"
#include <gtest/gtest.h>

using namespace mcphub;
using json = nlohmann::json;

TEST(MessageTest, ClassifiesRequest) {
    Message message = Message::parse({
        {"jsonrpc", "2.0"},
        {"id", "4"},
        {"method", "tools/call"},
        {"params", {{"name", "sum"}}}
    });

    ASSERT_TRUE(message.is_request());
    EXPECT_EQ(message.request().id, "4");
    EXPECT_EQ(message.method(), "tools/call");
    ASSERT_TRUE(message.request().params.has_value());
    EXPECT_EQ((*message.request().params)["name"], "sum");
}

TEST(MessageTest, ClassifiesNotification) {
    Message message = Message::parse({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});

    ASSERT_TRUE(message.is_notification());
    EXPECT_EQ(message.notification().method, "notifications/progress");
    EXPECT_FALSE(message.notification().params.has_value());
}

TEST(MessageTest, NullIdWithMethodIsNotification) {
    Message message = Message::parse({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "notifications/cancelled"}});
    EXPECT_TRUE(message.is_notification());
}

TEST(MessageTest, ClassifiesResultAndErrorResponses) {
    Message success = Message::parse({{"jsonrpc", "2.0"}, {"id", "1"}, {"result", {{"ok", true}}}});
    ASSERT_TRUE(success.is_response());
    EXPECT_FALSE(success.response().is_error());
    EXPECT_EQ((*success.response().result)["ok"], true);
    EXPECT_TRUE(success.method().empty());

    json error = {{"code", -32601}, {"message", "Method not found"}};
    Message failure = Message::parse({{"jsonrpc", "2.0"}, {"id", "2"}, {"error", error}});
    ASSERT_TRUE(failure.is_response());
    EXPECT_TRUE(failure.response().is_error());
    EXPECT_EQ(*failure.response().error, error);
}

TEST(MessageTest, NumericIdsAreNormalized) {
    Message response = Message::parse({{"jsonrpc", "2.0"}, {"id", 17}, {"result", json::object()}});
    EXPECT_EQ(response.response().id, "17");

    Message request = Message::parse({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "ping"}});
    EXPECT_EQ(request.request().id, "3");
}

TEST(MessageTest, RejectsMalformedEnvelopes) {
    EXPECT_THROW(Message::parse(json::array()), ProtocolViolation);
    EXPECT_THROW(Message::parse({{"jsonrpc", "1.0"}, {"method", "ping"}}), ProtocolViolation);
    EXPECT_THROW(Message::parse({{"jsonrpc", "2.0"}, {"id", "1"}}), ProtocolViolation);
    EXPECT_THROW(Message::parse({{"jsonrpc", "2.0"}, {"result", json::object()}}), ProtocolViolation);
    EXPECT_THROW(Message::parse({{"jsonrpc", "2.0"}, {"id", "1"}, {"result", 1}, {"error", json::object()}}),
                 ProtocolViolation);
    EXPECT_THROW(Message::parse({{"jsonrpc", "2.0"}, {"id", {{"nested", 1}}}, {"method", "ping"}}),
                 ProtocolViolation);
}

TEST(MessageTest, DecodeRejectsInvalidJson) {
    EXPECT_THROW(Message::decode("{not json"), ProtocolViolation);
    EXPECT_THROW(Message::decode(""), ProtocolViolation);
}

TEST(MessageTest, WireFormat) {
    json request = Message(Request{"1", "initialize", json{{"protocolVersion", "2024-11-05"}}}).to_json();
    EXPECT_EQ(request, (json{
        {"jsonrpc", "2.0"},
        {"id", "1"},
        {"method", "initialize"},
        {"params", {{"protocolVersion", "2024-11-05"}}}
    }));

    json notification = Message(Notification{"notifications/initialized", std::nullopt}).to_json();
    EXPECT_EQ(notification, (json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));
    EXPECT_FALSE(notification.contains("id"));

    json failure = Message(Response::failure("9", -32601, "Method not supported: x")).to_json();
    EXPECT_EQ(failure["error"]["code"], -32601);
    EXPECT_FALSE(failure.contains("result"));

    json success = Message(Response::success("9", json::object())).to_json();
    EXPECT_TRUE(success["result"].is_object());
    EXPECT_FALSE(success.contains("error"));
}

TEST(MessageTest, DecodeOfSerializedMessageKeepsKind) {
    Message original(Request{"12", "resources/read", json{{"uri", "file:///tmp/x"}}});
    Message decoded = Message::decode(original.to_json().dump());

    ASSERT_TRUE(decoded.is_request());
    EXPECT_EQ(decoded.request().id, "12");
    EXPECT_EQ((*decoded.request().params)["uri"], "file:///tmp/x");
}

TEST(TypesTest, ToolInfoDecoding) {
    ToolInfo tool = json{
        {"name", "search"},
        {"description", "Search files"},
        {"inputSchema", {{"type", "object"}}}
    }.get<ToolInfo>();
    EXPECT_EQ(tool.name, "search");
    EXPECT_EQ(tool.input_schema["type"], "object");

    ToolInfo bare = json{{"name", "bare"}}.get<ToolInfo>();
    EXPECT_TRUE(bare.description.empty());
    EXPECT_TRUE(bare.input_schema.is_object());

    EXPECT_THROW(json({{"description", "no name"}}).get<ToolInfo>(), json::exception);
}

TEST(TypesTest, ServerInfoSerialization) {
    ServerInfo info{"files", "2.1.0", "2024-11-05", {{"tools", json::object()}}};
    json j = info;
    EXPECT_EQ(j["name"], "files");
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(j["capabilities"].contains("tools"));
}
