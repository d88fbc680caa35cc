#include "mcp/MCPClient.hpp"
#include "mcp/ServiceRegistry.hpp"
#include "mcp/StdioTransport.hpp"
#include "mcp/Errors.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <mutex>

using namespace mcphub;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Line-oriented MCP peer written in POSIX sh. Matching relies on the compact,
// key-sorted output of nlohmann::json::dump().
const char* PEER_SCRIPT = R"SH(
while IFS= read -r line; do
  id=$(printf '%s\n' "$line" | sed -n 's/.*"id":"\([^"]*\)".*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":"%s","result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"serverInfo":{"name":"sh-peer","version":"0.1"}}}\n' "$id"
      ;;
    *'"method":"tools/list"'*)
      printf '{"jsonrpc":"2.0","method":"notifications/tools/list_changed"}\n'
      printf '{"jsonrpc":"2.0","id":"%s","result":{"tools":[{"name":"greet","description":"Say hello","inputSchema":{"type":"object"}},{"name":"fail"},{"name":"quit"}]}}\n' "$id"
      ;;
    *'"method":"tools/call"'*'"name":"fail"'*)
      printf '{"jsonrpc":"2.0","id":"%s","error":{"code":-32000,"message":"tool failed"}}\n' "$id"
      ;;
    *'"method":"tools/call"'*'"name":"quit"'*)
      exit 0
      ;;
    *'"method":"tools/call"'*)
      printf '{"jsonrpc":"2.0","id":"%s","result":{"content":[{"type":"text","text":"hello"}]}}\n' "$id"
      ;;
  esac
done
)SH";

ServiceConfig peer_config(const std::string& name = "sh-peer") {
    ServiceConfig config;
    config.name = name;
    config.transport = TransportType::Stdio;
    config.endpoint = "/bin/sh";
    config.args = std::vector<std::string>{"-c", PEER_SCRIPT};
    config.timeout_seconds = 5;
    config.retry_count = 1;
    return config;
}

} // namespace

TEST(StdioTransportTest, EchoPeerReturnsSentLine) {
    StdioTransport transport("cat");
    transport.connect();
    ASSERT_TRUE(transport.is_connected());
    EXPECT_GT(transport.pid(), 0);

    auto reply = transport.send(Request{"5", "tools/list", std::nullopt});
    EXPECT_FALSE(reply.has_value());

    Message echoed = transport.receive();
    ASSERT_TRUE(echoed.is_request());
    EXPECT_EQ(echoed.request().id, "5");
    EXPECT_EQ(echoed.method(), "tools/list");

    transport.disconnect();
    EXPECT_FALSE(transport.is_connected());
    EXPECT_EQ(transport.pid(), -1);
    EXPECT_NO_THROW(transport.disconnect());
}

TEST(StdioTransportTest, MissingCommandIsUnreachable) {
    StdioTransport transport("/nonexistent/mcphub-test-server --flag");
    try {
        transport.connect();
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.reason(), ConnectionError::Reason::Unreachable);
    }
    EXPECT_FALSE(transport.is_connected());
}

TEST(StdioTransportTest, ExitedPeerClosesStream) {
    StdioTransport transport("/bin/sh", {"-c", "exit 0"});
    transport.connect();

    try {
        transport.receive();
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.reason(), ConnectionError::Reason::Closed);
    }
    EXPECT_FALSE(transport.is_connected());
}

TEST(StdioTransportTest, SplitCommandHonoursQuotes) {
    auto words = StdioTransport::split_command("python  -m \"my server\" \t--port 1");
    ASSERT_EQ(words.size(), 5u);
    EXPECT_EQ(words[0], "python");
    EXPECT_EQ(words[2], "my server");
    EXPECT_EQ(words[4], "1");
    EXPECT_TRUE(StdioTransport::split_command("   ").empty());
}

TEST(StdioEndToEndTest, ClientTalksToScriptedPeer) {
    MCPClient client(peer_config());

    std::mutex mutex;
    std::vector<std::string> notifications;
    client.set_notification_handler([&](const Notification& notification) {
        std::lock_guard<std::mutex> lock(mutex);
        notifications.push_back(notification.method);
    });

    client.connect();
    ASSERT_TRUE(client.is_connected());
    ASSERT_TRUE(client.server_info().has_value());
    EXPECT_EQ(client.server_info()->name, "sh-peer");
    EXPECT_EQ(client.server_info()->version, "0.1");

    auto tools = client.list_tools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "greet");
    EXPECT_EQ(tools[0].description, "Say hello");
    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(notifications.size(), 1u);
        EXPECT_EQ(notifications[0], "notifications/tools/list_changed");
    }

    json result = client.call_tool("greet", {{"who", "world"}});
    EXPECT_EQ(result["content"][0]["text"], "hello");

    try {
        client.call_tool("fail", json::object());
        FAIL() << "Expected ToolInvocationError";
    } catch (const ToolInvocationError& e) {
        EXPECT_EQ(e.error()["code"], -32000);
        EXPECT_EQ(e.error()["message"], "tool failed");
    }
    EXPECT_TRUE(client.is_connected());

    EXPECT_THROW(client.call_tool("greet", {{"who", std::string("\xff\xfe")}}), ProtocolViolation);
    EXPECT_EQ(client.pending_count(), 0u);
    EXPECT_EQ(client.call_tool("greet", json::object())["content"][0]["text"], "hello");

    client.disconnect();
    EXPECT_EQ(client.state(), ClientState::Disconnected);
}

TEST(StdioEndToEndTest, PeerExitFailsInFlightCall) {
    MCPClient client(peer_config());
    client.connect();

    EXPECT_THROW(client.call_tool("quit", json::object()), ConnectionError);
    EXPECT_FALSE(client.is_connected());
    EXPECT_EQ(client.pending_count(), 0u);

    // A fresh process is launched on reconnect
    client.connect();
    EXPECT_TRUE(client.is_connected());
    EXPECT_EQ(client.call_tool("greet", json::object())["content"][0]["text"], "hello");
}

TEST(StdioEndToEndTest, RegistryDrivesStdioService) {
    fs::path dir = fs::temp_directory_path() / "mcphub_stdio_e2e";
    fs::remove_all(dir);

    {
        RegistryOptions options;
        options.config_dir = dir;
        options.backoff_base = std::chrono::milliseconds(1);
        options.backoff_cap = std::chrono::milliseconds(2);
        ServiceRegistry registry(options);
        registry.load_services();
        registry.add_service(peer_config("local-sh"));

        ASSERT_TRUE(registry.connect_service("local-sh"));
        auto all_tools = registry.list_all_tools();
        ASSERT_EQ(all_tools.count("local-sh"), 1u);
        EXPECT_EQ(all_tools["local-sh"].size(), 3u);

        json result = registry.call_tool("local-sh", "greet", json::object());
        EXPECT_EQ(result["content"][0]["text"], "hello");

        json status = registry.get_status();
        EXPECT_EQ(status["local-sh"]["connected"], true);
    }

    fs::remove_all(dir);
}
