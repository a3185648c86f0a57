#include <gtest/gtest.h>
#include "opsmcp/server.hpp"
#include "opsmcp/transport/http_transport.hpp"
#include "opsmcp/tools/devops_capabilities.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace opsmcp;

class HttpE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<Server> server_;
    std::unique_ptr<httplib::Client> client_;
    std::thread server_thread_;

    void SetUp() override {
        ServerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.tool_timeout = std::chrono::milliseconds(5000);
        config.log_level = "warn";
        config.apply_logging();
        server_ = std::make_unique<Server>(config);
        tools::register_builtin_tools(server_->registry());

        server_thread_ = std::thread([this]() { server_->serve(); });

        // Wait for server to be ready
        for (int i = 0; i < 200 && !server_->is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(server_->is_running());

        client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->port());
        client_->set_read_timeout(5, 0);
    }

    void TearDown() override {
        server_->shutdown();
        if (server_thread_.joinable()) server_thread_.join();
    }

    httplib::Result post(const std::string& body, const std::string& session_id = {},
                         const std::string& accept = "application/json") {
        httplib::Headers headers{{"Accept", accept}};
        if (!session_id.empty()) headers.emplace(SESSION_HEADER, session_id);
        return client_->Post("/mcp", headers, body, "application/json");
    }

    httplib::Result get(const std::string& action, const std::string& session_id = {}) {
        httplib::Headers headers;
        if (!session_id.empty()) headers.emplace(SESSION_HEADER, session_id);
        return client_->Get("/mcp?action=" + action, headers);
    }
};

// ---------- JSON-RPC over POST ----------

TEST_F(HttpE2ETest, InitializeHandshake) {
    auto res = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["jsonrpc"], "2.0");
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"]["serverInfo"]["name"], "devops-mcp-server");
    EXPECT_EQ(body["result"]["serverInfo"]["version"], "1.0.0");
    EXPECT_TRUE(body["result"].contains("capabilities"));
    EXPECT_FALSE(body.contains("error"));

    auto id = res->get_header_value(SESSION_HEADER);
    EXPECT_FALSE(id.empty());
    auto session = server_->sessions().find(id);
    ASSERT_NE(session, nullptr);
    EXPECT_TRUE(session->initialized());
}

TEST_F(HttpE2ETest, CallerSuppliedSessionIdIsAdopted) {
    auto res = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})", "client-chosen-id");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->get_header_value(SESSION_HEADER), "client-chosen-id");
    ASSERT_NE(server_->sessions().find("client-chosen-id"), nullptr);
}

TEST_F(HttpE2ETest, ListToolsAfterInitialize) {
    auto init = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    ASSERT_TRUE(init);
    auto id = init->get_header_value(SESSION_HEADER);

    auto res = post(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})", id);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 2);
    ASSERT_EQ(body["result"]["tools"].size(), 1u);
    const auto& tool = body["result"]["tools"][0];
    EXPECT_EQ(tool["name"], "devops_capabilities");
    EXPECT_EQ(tool["description"], "Get DevOps Capabilities");
    EXPECT_EQ(tool["inputSchema"]["properties"]["state"]["minLength"], 2);
    EXPECT_EQ(tool["inputSchema"]["required"][0], "state");
}

TEST_F(HttpE2ETest, CallWithoutPriorInitialize) {
    auto res = post(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"devops_capabilities","arguments":{}}})",
        "fresh-session");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 3);
    ASSERT_FALSE(body["result"]["content"].empty());
    EXPECT_NE(body["result"]["content"][0]["text"].get<std::string>().find("DevOps"), std::string::npos);

    auto session = server_->sessions().find("fresh-session");
    ASSERT_NE(session, nullptr);
    EXPECT_TRUE(session->initialized());
}

TEST_F(HttpE2ETest, CallWithState) {
    auto res = post(
        R"({"jsonrpc":"2.0","id":"c1","method":"tools/call","params":{"name":"devops_capabilities","arguments":{"state":"CA"}}})");
    ASSERT_TRUE(res);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], "c1");
    EXPECT_EQ(body["result"]["content"][0]["text"], "Active alerts for CA:\n\nSample DevOps data for CA");
}

TEST_F(HttpE2ETest, MissingToolNameLeavesSessionUninitialized) {
    auto res = post(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"arguments":{}}})",
                    "no-name-session");
    ASSERT_TRUE(res);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 5);
    EXPECT_TRUE(body.contains("error"));
    EXPECT_FALSE(body.contains("result"));

    auto session = server_->sessions().find("no-name-session");
    ASSERT_NE(session, nullptr);
    EXPECT_FALSE(session->initialized());
}

TEST_F(HttpE2ETest, UnknownToolIsNamed) {
    auto res = post(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"bogus"}})");
    ASSERT_TRUE(res);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 6);
    ASSERT_TRUE(body.contains("error"));
    EXPECT_NE(body["error"]["message"].get<std::string>().find("bogus"), std::string::npos);
}

TEST_F(HttpE2ETest, UnknownMethodIsError) {
    auto res = post(R"({"jsonrpc":"2.0","id":7,"method":"prompts/list"})");
    ASSERT_TRUE(res);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32603);
    EXPECT_NE(body["error"]["message"].get<std::string>().find("prompts/list"), std::string::npos);
}

TEST_F(HttpE2ETest, EventStreamFraming) {
    auto res = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})", {},
                    "application/json, text/event-stream");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->get_header_value("Content-Type").find("text/event-stream"), std::string::npos);

    const std::string prefix = "event: message\ndata: ";
    ASSERT_EQ(res->body.compare(0, prefix.size(), prefix), 0);
    ASSERT_GE(res->body.size(), prefix.size() + 2);
    EXPECT_EQ(res->body.substr(res->body.size() - 2), "\n\n");

    auto payload = res->body.substr(prefix.size(), res->body.size() - prefix.size() - 2);
    auto body = nlohmann::json::parse(payload);
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"]["serverInfo"]["name"], "devops-mcp-server");
}

TEST_F(HttpE2ETest, NotificationAccepted) {
    auto res = post(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", "notified");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(res->body.empty());
    auto session = server_->sessions().find("notified");
    ASSERT_NE(session, nullptr);
    EXPECT_TRUE(session->initialized());
}

TEST_F(HttpE2ETest, MalformedBodyRejectedWithoutSession) {
    auto res = post("{not json", "never-created");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32700);
    EXPECT_TRUE(body["id"].is_null());
    EXPECT_EQ(server_->sessions().find("never-created"), nullptr);
}

TEST_F(HttpE2ETest, InvalidEnvelopeRejected) {
    auto res = post(R"({"jsonrpc":"1.0","id":1,"method":"initialize"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32600);
}

TEST_F(HttpE2ETest, ConcurrentClients) {
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    const uint16_t port = server_->port();
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&ok, port, i] {
            httplib::Client cli("127.0.0.1", port);
            nlohmann::json req = {
                {"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                {"params", {{"name", "devops_capabilities"}, {"arguments", {{"state", "NY"}}}}}
            };
            auto res = cli.Post("/mcp", req.dump(), "application/json");
            if (res && res->status == 200 && nlohmann::json::parse(res->body)["id"] == i) ++ok;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 4);
}

// ---------- Plain HTTP actions ----------

TEST_F(HttpE2ETest, StatusAction) {
    auto res = get("status");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["status"], "running");
    EXPECT_EQ(body["server"], "devops-mcp-server");
    EXPECT_EQ(body["version"], "1.0.0");
    EXPECT_TRUE(body["sessions"].is_number());
}

TEST_F(HttpE2ETest, NewSessionAction) {
    auto res = get("new-session");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    auto id = body["sessionId"].get<std::string>();
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(res->get_header_value(SESSION_HEADER), id);
    EXPECT_NE(server_->sessions().find(id), nullptr);
}

TEST_F(HttpE2ETest, ListToolsActionRequiresInitializedSession) {
    auto before = get("list-tools", "plain-session");
    ASSERT_TRUE(before);
    EXPECT_EQ(before->status, 400);

    ASSERT_TRUE(post(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})", "plain-session"));

    auto after = get("list-tools", "plain-session");
    ASSERT_TRUE(after);
    EXPECT_EQ(after->status, 200);
    auto body = nlohmann::json::parse(after->body);
    EXPECT_EQ(body["tools"][0]["name"], "devops_capabilities");
}

TEST_F(HttpE2ETest, UnknownActionRejected) {
    auto res = get("reboot");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpE2ETest, CallToolAction) {
    auto res = post(R"({"action":"call-tool","toolName":"devops_capabilities","arguments":{"state":"TX"}})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["result"]["content"][0]["text"], "Active alerts for TX:\n\nSample DevOps data for TX");
}

TEST_F(HttpE2ETest, CallToolActionUnknownTool) {
    auto res = post(R"({"action":"call-tool","toolName":"bogus"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_NE(body["error"].get<std::string>().find("bogus"), std::string::npos);
}

TEST_F(HttpE2ETest, CallToolActionBadArguments) {
    auto res = post(R"({"action":"call-tool","toolName":"devops_capabilities","arguments":{"state":"Texas"}})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(HttpE2ETest, BodyWithoutActionRejected) {
    auto res = post(R"({"hello":"world"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

// ---------- Origin validation ----------

TEST(HttpOriginTest, RejectsDisallowedOrigin) {
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.allowed_origins = {"http://localhost:3000"};
    Server server(config);
    tools::register_builtin_tools(server.registry());
    std::thread t([&server] { server.serve(); });
    for (int i = 0; i < 200 && !server.is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!server.is_running()) {
        server.shutdown();
        t.join();
        FAIL() << "server did not start";
    }

    httplib::Client cli("127.0.0.1", server.port());
    auto denied = cli.Get("/mcp?action=status", httplib::Headers{{"Origin", "http://evil.example"}});
    auto allowed = cli.Get("/mcp?action=status", httplib::Headers{{"Origin", "http://localhost:3000"}});

    server.shutdown();
    t.join();

    ASSERT_TRUE(denied);
    EXPECT_EQ(denied->status, 403);
    ASSERT_TRUE(allowed);
    EXPECT_EQ(allowed->status, 200);
}
