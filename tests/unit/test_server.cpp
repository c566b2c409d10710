#include <gtest/gtest.h>
#include "mcpserve/server.hpp"
#include "mcpserve/codec.hpp"
#include "mcpserve/error.hpp"
#include <mutex>
#include <set>
#include <vector>

using namespace mcpserve;

namespace {

// Records everything pushed out-of-band. Ids in `unreachable` fail send_to.
class RecordingTransport : public ITransport {
public:
    void start(MessageHandler, DisconnectHandler) override {}

    void send(const JsonRpcMessage& msg) override {
        std::lock_guard<std::mutex> lock(mutex);
        broadcasts.push_back(to_json_value(msg));
    }

    bool send_to(const SubscriberId& to, const JsonRpcMessage& msg) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (unreachable.count(to)) return false;
        directed.emplace_back(to, to_json_value(msg));
        return true;
    }

    void shutdown() override { shut_down = true; }
    bool is_connected() const override { return true; }

    static nlohmann::json to_json_value(const JsonRpcMessage& msg) {
        nlohmann::json j;
        to_json(j, msg);
        return j;
    }

    std::mutex mutex;
    std::vector<nlohmann::json> broadcasts;
    std::vector<std::pair<SubscriberId, nlohmann::json>> directed;
    std::set<SubscriberId> unreachable;
    bool shut_down = false;
};

McpServer::Options test_options() {
    McpServer::Options opts;
    opts.server_info = {"test-server", "1.0.0"};
    return opts;
}

nlohmann::json request(McpServer& server, const std::string& raw, const SubscriberId& from = {}) {
    auto reply = server.handle_json(raw, from);
    if (!reply) return nullptr;
    return nlohmann::json::parse(*reply);
}

nlohmann::json call(McpServer& server, int id, const std::string& method,
                    const nlohmann::json& params, const SubscriberId& from = {}) {
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return request(server, msg.dump(), from);
}

void handshake(McpServer& server) {
    auto init = call(server, 1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "0.0.1"}}}
    });
    ASSERT_TRUE(init.contains("result"));
    EXPECT_FALSE(server.handle_json(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
}

FunctionTool echo_tool() {
    return FunctionTool{
        ToolDefinition{"echo", "Echo back the message", nlohmann::json{
            {"type", "object"},
            {"properties", {{"message", {{"type", "string"}}}}},
            {"required", {"message"}}
        }},
        [](const nlohmann::json& args) {
            return CallToolResult{{TextContent{args.at("message").get<std::string>()}}, false};
        }};
}

} // anonymous namespace

TEST(McpServer, Construction) {
    McpServer server(test_options());
    EXPECT_FALSE(server.is_running());
    EXPECT_FALSE(server.initialized());
}

TEST(McpServer, Ping) {
    McpServer server(test_options());
    auto reply = request(server, R"({"jsonrpc":"2.0","id":7,"method":"ping"})");
    EXPECT_EQ(reply["id"], 7);
    EXPECT_EQ(reply["result"], nlohmann::json::object());
}

TEST(McpServer, InitializeReportsServerAndCapabilities) {
    McpServer server(test_options());
    auto reply = call(server, 1, "initialize", {{"protocolVersion", "2024-11-05"}});
    const auto& result = reply["result"];
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["serverInfo"]["name"], "test-server");
    EXPECT_EQ(result["serverInfo"]["version"], "1.0.0");
    EXPECT_EQ(result["capabilities"]["resources"]["subscribe"], true);
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_TRUE(result["capabilities"].contains("prompts"));
}

TEST(McpServer, RepeatedInitializeAnswersAgain) {
    McpServer server(test_options());
    handshake(server);
    auto reply = call(server, 2, "initialize", nlohmann::json::object());
    EXPECT_EQ(reply["id"], 2);
    EXPECT_EQ(reply["result"]["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(server.initialized());
}

TEST(McpServer, CapabilitiesAreMergedOverDefaults) {
    auto opts = test_options();
    opts.capabilities = {{"tools", {{"listChanged", false}}}, {"experimental", {{"x", 1}}}};
    McpServer server(std::move(opts));
    auto caps = server.capabilities();
    EXPECT_EQ(caps["tools"]["listChanged"], false);
    EXPECT_EQ(caps["experimental"]["x"], 1);
    EXPECT_EQ(caps["resources"]["subscribe"], true);
}

TEST(McpServer, InitializedNotificationFlipsState) {
    McpServer server(test_options());
    EXPECT_FALSE(server.initialized());
    handshake(server);
    EXPECT_TRUE(server.initialized());
}

TEST(McpServer, UnparsableInputIsInvalidRequestWithNullId) {
    McpServer server(test_options());
    auto reply = request(server, "{not json");
    EXPECT_TRUE(reply["id"].is_null());
    EXPECT_EQ(reply["error"]["code"], error::InvalidRequest);
    EXPECT_EQ(reply["error"]["message"], "Invalid Request");
}

TEST(McpServer, WrongVersionKeepsId) {
    McpServer server(test_options());
    auto reply = request(server, R"({"jsonrpc":"1.0","id":3,"method":"ping"})");
    EXPECT_EQ(reply["id"], 3);
    EXPECT_EQ(reply["error"]["code"], error::InvalidRequest);
}

TEST(McpServer, UnknownMethod) {
    McpServer server(test_options());
    auto reply = request(server, R"({"jsonrpc":"2.0","id":4,"method":"bogus/method"})");
    EXPECT_EQ(reply["error"]["code"], error::MethodNotFound);
    EXPECT_EQ(reply["error"]["message"], "Method not found: bogus/method");
}

TEST(McpServer, NotificationsNeverGetAResponse) {
    McpServer server(test_options());
    EXPECT_FALSE(server.handle_json(R"({"jsonrpc":"2.0","method":"ping"})"));
    EXPECT_FALSE(server.handle_json(R"({"jsonrpc":"2.0","method":"bogus"})"));
    EXPECT_FALSE(server.handle_json(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"));
}

TEST(McpServer, ToolsListAndCall) {
    McpServer server(test_options());
    auto tool = echo_tool();
    server.add_tool(tool);

    auto list = call(server, 1, "tools/list", nlohmann::json::object());
    ASSERT_EQ(list["result"]["tools"].size(), 1u);
    EXPECT_EQ(list["result"]["tools"][0]["name"], "echo");
    EXPECT_EQ(list["result"]["tools"][0]["inputSchema"]["required"][0], "message");

    auto reply = call(server, 2, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}});
    EXPECT_EQ(reply["result"]["content"][0]["text"], "hi");
    EXPECT_EQ(reply["result"]["isError"], false);
}

TEST(McpServer, ToolErrorsAreReportedInTheResult) {
    McpServer server(test_options());
    auto tool = echo_tool();
    server.add_tool(tool);

    auto reply = call(server, 1, "tools/call", {{"name", "echo"}, {"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(reply.contains("result"));
    EXPECT_EQ(reply["result"]["isError"], true);
    EXPECT_EQ(reply["result"]["content"][0]["text"], "Error: missing required arguments: message");

    FunctionTool failing{ToolDefinition{"fail", std::nullopt, std::nullopt},
                         [](const nlohmann::json&) -> CallToolResult {
                             throw std::runtime_error("boom");
                         }};
    server.add_tool(failing);
    reply = call(server, 2, "tools/call", {{"name", "fail"}});
    EXPECT_EQ(reply["result"]["isError"], true);
    EXPECT_EQ(reply["result"]["content"][0]["text"], "Error: boom");
}

TEST(McpServer, ToolLookupErrors) {
    McpServer server(test_options());
    auto reply = call(server, 1, "tools/call", nlohmann::json::object());
    EXPECT_EQ(reply["error"]["code"], error::InvalidParams);
    EXPECT_EQ(reply["error"]["message"], "Invalid params: missing tool name");

    reply = call(server, 2, "tools/call", {{"name", "nope"}});
    EXPECT_EQ(reply["error"]["code"], error::InvalidParams);
    EXPECT_EQ(reply["error"]["message"], "Tool not found: nope");
}

TEST(McpServer, RemoveTool) {
    McpServer server(test_options());
    auto tool = echo_tool();
    server.add_tool(tool);
    EXPECT_TRUE(server.remove_tool("echo"));
    EXPECT_FALSE(server.remove_tool("echo"));
    auto list = call(server, 1, "tools/list", nlohmann::json::object());
    EXPECT_TRUE(list["result"]["tools"].empty());
}

TEST(McpServer, ResourcesListAndRead) {
    McpServer server(test_options());
    TextResource readme{ResourceDefinition{"file:///readme", "Readme", std::nullopt, "text/plain"}, "hello"};
    server.add_resource(readme);

    auto list = call(server, 1, "resources/list", nlohmann::json::object());
    ASSERT_EQ(list["result"]["resources"].size(), 1u);
    EXPECT_EQ(list["result"]["resources"][0]["uri"], "file:///readme");
    EXPECT_EQ(list["result"]["resources"][0]["mimeType"], "text/plain");

    auto read = call(server, 2, "resources/read", {{"uri", "file:///readme"}});
    const auto& contents = read["result"]["contents"];
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0]["uri"], "file:///readme");
    EXPECT_EQ(contents[0]["text"], "hello");
    EXPECT_FALSE(contents[0].contains("blob"));
}

TEST(McpServer, BinaryResourceIsReadAsBlob) {
    McpServer server(test_options());
    TextResource image{ResourceDefinition{"file:///img", "Image", std::nullopt, "image/png"},
                       std::string("\x89PNG", 4), true};
    server.add_resource(image);

    auto read = call(server, 1, "resources/read", {{"uri", "file:///img"}});
    const auto& content = read["result"]["contents"][0];
    EXPECT_EQ(content["blob"], "iVBORw==");
    EXPECT_FALSE(content.contains("text"));
}

TEST(McpServer, ReadMissingResource) {
    McpServer server(test_options());
    auto reply = call(server, 1, "resources/read", {{"uri", "x://missing"}});
    EXPECT_EQ(reply["error"]["code"], error::InvalidParams);
    EXPECT_EQ(reply["error"]["message"], "Resource not found: x://missing");

    reply = call(server, 2, "resources/read", nlohmann::json::object());
    EXPECT_EQ(reply["error"]["message"], "Invalid params: missing resource URI");

    EXPECT_THROW(server.read_resource("x://missing"), McpError);
}

TEST(McpServer, PromptsListAndGet) {
    McpServer server(test_options());
    FunctionPrompt greet{
        PromptDefinition{"greet", "Greeting", {{"name", "Who", true}}},
        [](const nlohmann::json& args) {
            return std::vector<PromptMessage>{text_message("user", "Hello " + args.at("name").get<std::string>())};
        }};
    server.add_prompt(greet);

    auto list = call(server, 1, "prompts/list", nlohmann::json::object());
    ASSERT_EQ(list["result"]["prompts"].size(), 1u);
    EXPECT_EQ(list["result"]["prompts"][0]["arguments"][0]["required"], true);

    auto reply = call(server, 2, "prompts/get", {{"name", "greet"}, {"arguments", {{"name", "Ada"}}}});
    EXPECT_EQ(reply["result"]["messages"][0]["role"], "user");
    EXPECT_EQ(reply["result"]["messages"][0]["content"]["text"], "Hello Ada");
}

TEST(McpServer, PromptErrorsAreProtocolErrors) {
    McpServer server(test_options());
    FunctionPrompt greet{
        PromptDefinition{"greet", std::nullopt, {{"name", std::nullopt, true}}},
        [](const nlohmann::json&) { return std::vector<PromptMessage>{text_message("user", "x")}; }};
    server.add_prompt(greet);

    auto reply = call(server, 1, "prompts/get", {{"name", "greet"}});
    EXPECT_EQ(reply["error"]["code"], error::InvalidParams);
    EXPECT_EQ(reply["error"]["message"], "Error: missing required argument: name");

    reply = call(server, 2, "prompts/get", {{"name", "nope"}});
    EXPECT_EQ(reply["error"]["message"], "Prompt not found: nope");

    reply = call(server, 3, "prompts/get", nlohmann::json::object());
    EXPECT_EQ(reply["error"]["message"], "Invalid params: missing prompt name");
}

TEST(McpServer, SubscribeIgnoredBeforeInitialization) {
    McpServer server(test_options());
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    auto reply = call(server, 1, "resources/subscribe", {{"uri", "file:///a"}});
    EXPECT_TRUE(reply.is_null());
}

TEST(McpServer, SubscribeAndUnsubscribe) {
    McpServer server(test_options());
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    handshake(server);

    auto reply = call(server, 2, "resources/subscribe", {{"uri", "file:///a"}});
    EXPECT_EQ(reply["result"]["subscribed"], true);

    reply = call(server, 3, "resources/subscribe", {{"uri", "file:///nope"}});
    EXPECT_EQ(reply["error"]["code"], error::InvalidParams);
    EXPECT_EQ(reply["error"]["message"], "Resource not found: file:///nope");

    reply = call(server, 4, "resources/unsubscribe", {{"uri", "file:///a"}});
    EXPECT_EQ(reply["result"]["unsubscribed"], true);
    reply = call(server, 5, "resources/unsubscribe", {{"uri", "file:///a"}});
    EXPECT_EQ(reply["result"]["unsubscribed"], true);
}

TEST(McpServer, UpdateNotifiesSubscribersOnly) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, "text/plain"}, "1"};
    TextResource other{ResourceDefinition{"file:///b", "B", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    server.add_resource(other);
    handshake(server);

    call(server, 2, "resources/subscribe", {{"uri", "file:///a"}}, "conn-1");
    EXPECT_TRUE(server.update_resource("file:///a", "2"));
    EXPECT_TRUE(server.update_resource("file:///b", "2"));
    EXPECT_FALSE(server.update_resource("file:///nope", "2"));

    ASSERT_EQ(transport.directed.size(), 1u);
    EXPECT_EQ(transport.directed[0].first, "conn-1");
    const auto& notif = transport.directed[0].second;
    EXPECT_EQ(notif["method"], "notifications/resources/updated");
    EXPECT_EQ(notif["params"]["uri"], "file:///a");
    EXPECT_EQ(notif["params"]["name"], "A");
    EXPECT_EQ(notif["params"]["mimeType"], "text/plain");
    EXPECT_FALSE(notif.contains("id"));
    EXPECT_EQ(res.content(), "2");
    server.detach();
}

TEST(McpServer, NoUpdateNotificationBeforeInitialized) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);

    EXPECT_TRUE(server.update_resource("file:///a", "2"));
    EXPECT_TRUE(transport.directed.empty());
    EXPECT_TRUE(transport.broadcasts.empty());

    handshake(server);
    call(server, 2, "resources/subscribe", {{"uri", "file:///a"}});
    EXPECT_TRUE(transport.directed.empty());
    server.detach();
}

TEST(McpServer, UnreachableSubscriberIsDropped) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    handshake(server);

    call(server, 2, "resources/subscribe", {{"uri", "file:///a"}}, "gone");
    call(server, 3, "resources/subscribe", {{"uri", "file:///a"}}, "live");
    transport.unreachable.insert("gone");

    server.update_resource("file:///a", "2");
    ASSERT_EQ(transport.directed.size(), 1u);
    EXPECT_EQ(transport.directed[0].first, "live");

    transport.unreachable.clear();
    transport.directed.clear();
    server.update_resource("file:///a", "3");
    ASSERT_EQ(transport.directed.size(), 1u);
    EXPECT_EQ(transport.directed[0].first, "live");
    server.detach();
}

TEST(McpServer, SubscriberGoneForgetsSubscriptions) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    handshake(server);

    call(server, 2, "resources/subscribe", {{"uri", "file:///a"}}, "conn-1");
    server.subscriber_gone("conn-1");
    server.update_resource("file:///a", "2");
    EXPECT_TRUE(transport.directed.empty());
    server.detach();
}

TEST(McpServer, ListChangedBroadcastAfterInitialization) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);

    auto before = echo_tool();
    server.add_tool(before);
    EXPECT_TRUE(transport.broadcasts.empty());

    handshake(server);
    auto tool = echo_tool();
    server.add_tool(tool);
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    FunctionPrompt prompt{PromptDefinition{"p", std::nullopt, {}},
                          [](const nlohmann::json&) { return std::vector<PromptMessage>{text_message("user", "x")}; }};
    server.add_prompt(prompt);

    ASSERT_EQ(transport.broadcasts.size(), 3u);
    EXPECT_EQ(transport.broadcasts[0]["method"], "notifications/tools/list_changed");
    EXPECT_EQ(transport.broadcasts[1]["method"], "notifications/resources/listChanged");
    EXPECT_EQ(transport.broadcasts[2]["method"], "notifications/prompts/list_changed");
    server.detach();
}

TEST(McpServer, ResourceUpdateCallbacks) {
    McpServer server(test_options());
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, "text/plain"}, "1"};
    server.add_resource(res);

    std::vector<ResourceUpdate> seen;
    auto id = server.on_resource_update([&](const ResourceUpdate& u) { seen.push_back(u); });
    server.on_resource_update([](const ResourceUpdate&) { throw std::runtime_error("ignored"); });

    EXPECT_TRUE(server.update_resource("file:///a", "2"));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].uri, "file:///a");
    EXPECT_EQ(seen[0].name, "A");
    EXPECT_EQ(seen[0].mime_type, std::optional<std::string>("text/plain"));
    EXPECT_EQ(seen[0].content, "2");

    EXPECT_TRUE(server.remove_resource_update_callback(id));
    EXPECT_FALSE(server.remove_resource_update_callback(id));
    server.update_resource("file:///a", "3");
    EXPECT_EQ(seen.size(), 1u);
}

TEST(McpServer, RemoveResourceDropsSubscriptions) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);
    TextResource res{ResourceDefinition{"file:///a", "A", std::nullopt, std::nullopt}, "1"};
    server.add_resource(res);
    handshake(server);
    call(server, 2, "resources/subscribe", {{"uri", "file:///a"}}, "conn-1");

    EXPECT_TRUE(server.remove_resource("file:///a"));
    EXPECT_FALSE(server.remove_resource("file:///a"));
    server.add_resource(res);
    server.update_resource("file:///a", "2");
    EXPECT_TRUE(transport.directed.empty());
    server.detach();
}

TEST(McpServer, ShutdownReachesAttachedTransport) {
    McpServer server(test_options());
    RecordingTransport transport;
    server.attach(transport);
    server.shutdown();
    EXPECT_TRUE(transport.shut_down);
    server.detach();
}
