#include <gtest/gtest.h>
#include "bridge_server.hpp"
#include "host/in_memory_workspace.hpp"
#include "json_rpc.hpp"
#include "stdio_server.hpp"
#include "tool_catalog.hpp"
#include "tool_registry.hpp"

#include <sstream>

#include <unistd.h>

using namespace pulsar_mcp;
using nlohmann::json;

namespace {

StdioConfig ConfigFor(const BridgeEndpoint& ep) {
    StdioConfig cfg;
    cfg.bridge = ep;
    cfg.health_timeout_seconds = 1;
    cfg.call_timeout_seconds = 5;
    return cfg;
}

}  // namespace

class McpStdioServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        BridgeConfig cfg;
        cfg.base_port = 25000 + static_cast<int>(::getpid() % 20000);
        bridge = std::make_unique<BridgeServer>(&registry, cfg);
        std::string err;
        ASSERT_TRUE(bridge->Start(&err)) << err;
        server = std::make_unique<McpStdioServer>(ConfigFor(bridge->address()));
    }

    void TearDown() override {
        if (bridge) bridge->Stop();
    }

    json Call(const std::string& line) {
        auto resp = server->HandleLine(line);
        EXPECT_TRUE(resp.has_value()) << line;
        return resp ? *resp : json();
    }

    InMemoryWorkspace ws;
    ToolRegistry registry = BuildDefaultToolRegistry(&ws);
    std::unique_ptr<BridgeServer> bridge;
    std::unique_ptr<McpStdioServer> server;
};

TEST_F(McpStdioServerTest, Initialize) {
    auto r = Call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    EXPECT_EQ(r["id"], 1);
    EXPECT_EQ(r["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(r["result"]["capabilities"], json({{"tools", json::object()}}));
    EXPECT_EQ(r["result"]["serverInfo"]["name"], "pulsar");
    EXPECT_TRUE(r["result"]["serverInfo"]["version"].is_string());
}

TEST_F(McpStdioServerTest, PingReturnsEmptyObject) {
    auto r = Call(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
    EXPECT_EQ(r["id"], "p");
    EXPECT_EQ(r["result"], json::object());
}

TEST_F(McpStdioServerTest, ToolsListMatchesCatalog) {
    auto r = Call(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    EXPECT_EQ(r["result"]["tools"], ToolCatalogJson());
}

TEST_F(McpStdioServerTest, UnknownMethod) {
    auto r = Call(R"({"jsonrpc":"2.0","id":3,"method":"resources/list"})");
    EXPECT_EQ(r["error"]["code"], kJsonRpcMethodNotFound);
    EXPECT_EQ(r["error"]["message"], "Method not found: resources/list");
}

TEST_F(McpStdioServerTest, NotificationsAreNeverAnswered) {
    EXPECT_FALSE(server->HandleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server->HandleLine(R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"Nope"}})").has_value());
    EXPECT_FALSE(server->HandleLine("   ").has_value());
}

TEST_F(McpStdioServerTest, ParseErrorThenContinues) {
    auto bad = Call("{not json");
    EXPECT_TRUE(bad["id"].is_null());
    EXPECT_EQ(bad["error"]["code"], kJsonRpcParseError);

    auto good = Call(R"({"jsonrpc":"2.0","id":4,"method":"ping"})");
    EXPECT_EQ(good["id"], 4);
    EXPECT_TRUE(good.contains("result"));
}

TEST_F(McpStdioServerTest, NonObjectIsInvalidRequest) {
    auto r = Call("[1,2,3]");
    EXPECT_TRUE(r["id"].is_null());
    EXPECT_EQ(r["error"]["code"], kJsonRpcInvalidRequest);
}

TEST_F(McpStdioServerTest, MissingToolName) {
    auto r = Call(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{}})");
    EXPECT_EQ(r["error"]["code"], kJsonRpcInvalidParams);
}

TEST_F(McpStdioServerTest, GetProjectPathsEndToEnd) {
    auto r = Call(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"GetProjectPaths","arguments":{}}})");
    ASSERT_TRUE(r.contains("result")) << r.dump();
    const auto& content = r["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[0]["text"], "[]");
}

TEST_F(McpStdioServerTest, MissingArgumentsDefaultToEmptyObject) {
    auto r = Call(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"GetPanelState"}})");
    ASSERT_TRUE(r.contains("result")) << r.dump();
    auto data = json::parse(r["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(data["panes"]["count"], 1);
}

TEST_F(McpStdioServerTest, UnknownToolIsMethodNotFound) {
    auto r = Call(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"Nope"}})");
    EXPECT_EQ(r["error"]["code"], kJsonRpcMethodNotFound);
    EXPECT_EQ(r["error"]["message"], "Unknown tool: Nope");
}

TEST_F(McpStdioServerTest, ToolFailureCarriesBridgeError) {
    auto r = Call(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"InsertText","arguments":{"text":"x"}}})");
    EXPECT_EQ(r["error"]["code"], kJsonRpcInternalError);
    EXPECT_EQ(r["error"]["message"], "No active editor");
}

TEST_F(McpStdioServerTest, ToolSuccessIsPrettyPrintedData) {
    ws.OpenUntitled("");
    auto r = Call(R"({"jsonrpc":"2.0","id":10,"method":"tools/call","params":{"name":"InsertText","arguments":{"text":"x"}}})");
    ASSERT_TRUE(r.contains("result")) << r.dump();
    EXPECT_EQ(r["result"]["content"][0]["text"], json({{"inserted", true}}).dump(2));
}

TEST_F(McpStdioServerTest, BridgeDownNamesHostAndPort) {
    const auto ep = bridge->address();
    bridge->Stop();
    McpStdioServer detached(ConfigFor(ep));
    auto r = detached.HandleLine(
        R"({"jsonrpc":"2.0","id":11,"method":"tools/call","params":{"name":"GetProjectPaths","arguments":{}}})");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ((*r)["id"], 11);
    EXPECT_EQ((*r)["error"]["code"], kJsonRpcInternalError);
    const auto msg = (*r)["error"]["message"].get<std::string>();
    EXPECT_NE(msg.find("Pulsar bridge not available"), std::string::npos);
    EXPECT_NE(msg.find(ep.host + ":" + std::to_string(ep.port)), std::string::npos);
}

TEST_F(McpStdioServerTest, RunWritesOneLinePerRequest) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "garbage\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\r\n");
    std::ostringstream out;
    EXPECT_EQ(server->Run(in, out), 0);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> responses;
    while (std::getline(lines, line)) responses.push_back(json::parse(line));
    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["error"]["code"], kJsonRpcParseError);
    EXPECT_EQ(responses[2]["id"], 2);
}
