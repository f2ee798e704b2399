#include <gtest/gtest.h>
#include "bridge_server.hpp"
#include "host/in_memory_workspace.hpp"
#include "tool_catalog.hpp"
#include "tool_registry.hpp"

#include <httplib.h>

#include <unistd.h>

using namespace pulsar_mcp;
using nlohmann::json;

namespace {

int TestBasePort() {
    return 20000 + static_cast<int>(::getpid() % 20000);
}

}  // namespace

class BridgeServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        BridgeConfig cfg;
        cfg.base_port = TestBasePort();
        bridge = std::make_unique<BridgeServer>(&registry, cfg);
        std::string err;
        ASSERT_TRUE(bridge->Start(&err)) << err;
        client = std::make_unique<httplib::Client>(bridge->address().host, bridge->address().port);
        client->set_connection_timeout(2);
        client->set_read_timeout(5);
    }

    void TearDown() override {
        client.reset();
        if (bridge) bridge->Stop();
    }

    InMemoryWorkspace ws;
    ToolRegistry registry = BuildDefaultToolRegistry(&ws);
    std::unique_ptr<BridgeServer> bridge;
    std::unique_ptr<httplib::Client> client;
};

TEST_F(BridgeServerTest, HealthIsIdempotent) {
    for (int i = 0; i < 2; i++) {
        auto res = client->Get("/health");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 200);
        auto body = json::parse(res->body);
        EXPECT_EQ(body["status"], "ok");
        EXPECT_TRUE(body["timestamp"].is_number_integer());
    }
    EXPECT_TRUE(bridge->IsRunning());
}

TEST_F(BridgeServerTest, ListsCatalog) {
    auto res = client->Get("/tools");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["tools"], ToolCatalogJson());
}

TEST_F(BridgeServerTest, CorsHeaderOnEveryResponse) {
    auto res = client->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

    res = client->Get("/missing");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(BridgeServerTest, PreflightReturns204) {
    auto res = client->Options("/tools/InsertText");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Headers"), "Content-Type");
}

TEST_F(BridgeServerTest, UnknownRouteIs404) {
    auto res = client->Get("/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body), json({{"error", "Not found"}}));

    res = client->Post("/tools/lowercase", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(BridgeServerTest, EmptyBodyIsEmptyArguments) {
    auto res = client->Post("/tools/GetProjectPaths", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["data"], json::array());
    EXPECT_TRUE(body["error"].is_null());
}

TEST_F(BridgeServerTest, MalformedBodyIs400) {
    for (const char* payload : {"{not json", "[1,2]", "\"text\""}) {
        auto res = client->Post("/tools/GetProjectPaths", payload, "application/json");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 400) << payload;
        EXPECT_EQ(json::parse(res->body), json({{"success", false}, {"data", nullptr}, {"error", "Invalid JSON body"}}));
    }
}

TEST_F(BridgeServerTest, UnknownToolIs400Envelope) {
    auto res = client->Post("/tools/NoSuchTool", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"], "Unknown tool: NoSuchTool");
}

TEST_F(BridgeServerTest, ValidationAndHostFailuresAre400) {
    auto res = client->Post("/tools/InsertText", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"], "text is required");

    res = client->Post("/tools/InsertText", R"({"text":"x"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"], "No active editor");
}

TEST_F(BridgeServerTest, SuccessfulCallMutatesHost) {
    ws.OpenUntitled("");
    auto res = client->Post("/tools/InsertText", R"({"text":"from http"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["data"], json({{"inserted", true}}));
    EXPECT_EQ(ws.ActiveEditor()->content, "from http");
}

TEST_F(BridgeServerTest, SecondInstanceProbesNextPort) {
    BridgeConfig cfg;
    cfg.base_port = bridge->address().port;
    BridgeServer second(&registry, cfg);
    std::string err;
    ASSERT_TRUE(second.Start(&err)) << err;
    EXPECT_GT(second.address().port, bridge->address().port);

    httplib::Client c(second.address().host, second.address().port);
    auto res = c.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    second.Stop();
}

TEST_F(BridgeServerTest, HandlerExceptionBecomes500) {
    BridgeConfig cfg;
    cfg.base_port = bridge->address().port;
    BridgeServer detached(nullptr, cfg);
    std::string err;
    ASSERT_TRUE(detached.Start(&err)) << err;

    httplib::Client c(detached.address().host, detached.address().port);
    c.set_read_timeout(5);
    auto res = c.Post("/tools/GetProjectPaths", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    EXPECT_EQ(json::parse(res->body), json({{"error", "no tool registry attached"}}));
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

    res = c.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(detached.IsRunning());
    detached.Stop();
}

TEST_F(BridgeServerTest, StopIsIdempotent) {
    const auto port = bridge->address().port;
    bridge->Stop();
    bridge->Stop();
    bridge->Wait();
    EXPECT_FALSE(bridge->IsRunning());

    httplib::Client c("127.0.0.1", port);
    c.set_connection_timeout(1);
    EXPECT_FALSE(c.Get("/health"));
}

TEST(BridgeServerConfigTest, RefusesNonLoopbackHost) {
    InMemoryWorkspace ws;
    auto registry = BuildDefaultToolRegistry(&ws);
    BridgeConfig cfg;
    cfg.host = "0.0.0.0";
    BridgeServer bridge(&registry, cfg);
    std::string err;
    EXPECT_FALSE(bridge.Start(&err));
    EXPECT_NE(err.find("non-loopback"), std::string::npos);
    bridge.Stop();
}

TEST(BridgeServerConfigTest, FailsWhenProbeWindowIsExhausted) {
    InMemoryWorkspace ws;
    auto registry = BuildDefaultToolRegistry(&ws);
    BridgeConfig cfg;
    cfg.base_port = TestBasePort() + 500;
    BridgeServer first(&registry, cfg);
    std::string err;
    ASSERT_TRUE(first.Start(&err)) << err;

    cfg.base_port = first.address().port;
    cfg.max_port_probes = 1;
    BridgeServer second(&registry, cfg);
    EXPECT_FALSE(second.Start(&err));
    EXPECT_NE(err.find("no free port"), std::string::npos);
}

TEST(BridgeServerConfigTest, StopBeforeStartIsSafe) {
    InMemoryWorkspace ws;
    auto registry = BuildDefaultToolRegistry(&ws);
    BridgeServer bridge(&registry, BridgeConfig{});
    bridge.Stop();
    EXPECT_FALSE(bridge.IsRunning());
}
