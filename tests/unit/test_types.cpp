#include <gtest/gtest.h>
#include "opsmcp/types.hpp"
#include <nlohmann/json.hpp>

using namespace opsmcp;

// ---- TextContent ----

TEST(TextContent, Serialize) {
    TextContent tc{"Hello, world!"};

    nlohmann::json j;
    to_json(j, tc);
    EXPECT_EQ(j["type"], "text");
    EXPECT_EQ(j["text"], "Hello, world!");
}

TEST(Content, UnknownTypeRejected) {
    Content c;
    EXPECT_THROW(from_json(nlohmann::json{{"type", "image"}, {"data", ""}}, c), std::invalid_argument);
}

// ---- Schema ----

TEST(InputSchema, AdvertisedShape) {
    InputSchema schema;
    PropertySchema env;
    env.type = "string";
    env.enum_values = std::vector<std::string>{"dev", "prod"};
    env.description = "Target environment";
    PropertySchema code;
    code.type = "string";
    code.min_length = 2;
    code.max_length = 2;
    schema.property("env", env, true).property("code", code);

    nlohmann::json j = schema;
    EXPECT_EQ(j["type"], "object");
    EXPECT_EQ(j["properties"]["env"]["enum"], nlohmann::json({"dev", "prod"}));
    EXPECT_EQ(j["properties"]["env"]["description"], "Target environment");
    EXPECT_EQ(j["properties"]["code"]["minLength"], 2);
    EXPECT_EQ(j["properties"]["code"]["maxLength"], 2);
    EXPECT_FALSE(j["properties"]["code"].contains("enum"));
    EXPECT_EQ(j["required"], nlohmann::json({"env"}));
}

TEST(InputSchema, EmptySchemaHasNoRequired) {
    nlohmann::json j = InputSchema{};
    EXPECT_EQ(j["type"], "object");
    EXPECT_TRUE(j["properties"].is_object());
    EXPECT_TRUE(j["properties"].empty());
    EXPECT_FALSE(j.contains("required"));
}

TEST(InputSchema, RedeclaringPropertyReplacesIt) {
    InputSchema schema;
    schema.property("x", PropertySchema{"string", std::nullopt, std::nullopt, std::nullopt, std::nullopt}, true);
    schema.property("x", PropertySchema{"integer", std::nullopt, std::nullopt, std::nullopt, std::nullopt}, true);
    ASSERT_EQ(schema.properties.size(), 1u);
    EXPECT_EQ(schema.properties[0].second.type, "integer");
    EXPECT_EQ(schema.required.size(), 1u);
}

TEST(InputSchema, ParsesClientSchema) {
    auto j = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {"state": {"type": "string", "minLength": 2, "maxLength": 2}},
        "required": ["state"]
    })");
    auto schema = j.get<InputSchema>();
    ASSERT_EQ(schema.properties.size(), 1u);
    EXPECT_EQ(schema.properties[0].first, "state");
    EXPECT_EQ(schema.properties[0].second.min_length, 2u);
    EXPECT_EQ(schema.required, std::vector<std::string>{"state"});
}

// ---- ToolDefinition ----

TEST(ToolDefinition, AdvertisedTriple) {
    ToolDefinition def;
    def.name = "devops_capabilities";
    def.description = "Get DevOps Capabilities";

    nlohmann::json j = def;
    EXPECT_EQ(j.size(), 3u);
    EXPECT_EQ(j["name"], "devops_capabilities");
    EXPECT_EQ(j["description"], "Get DevOps Capabilities");
    EXPECT_TRUE(j.contains("inputSchema"));
    EXPECT_EQ(j.get<ToolDefinition>(), def);
}

// ---- CallToolResult ----

TEST(CallToolResult, SuccessOmitsIsError) {
    CallToolResult r;
    r.content.push_back(TextContent{"ok"});

    nlohmann::json j = r;
    ASSERT_EQ(j["content"].size(), 1u);
    EXPECT_EQ(j["content"][0]["type"], "text");
    EXPECT_FALSE(j.contains("isError"));
}

TEST(CallToolResult, ErrorFlag) {
    CallToolResult r;
    r.is_error = true;

    nlohmann::json j = r;
    EXPECT_TRUE(j["content"].is_array());
    EXPECT_EQ(j["isError"], true);
}

// ---- InitializeResult ----

TEST(InitializeResult, Shape) {
    InitializeResult r;
    r.protocol_version = "2024-11-05";
    r.capabilities.tools = nlohmann::json::object();
    r.server_info = {"devops-mcp-server", "1.0.0"};

    nlohmann::json j = r;
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(j["capabilities"]["tools"].is_object());
    EXPECT_TRUE(j["capabilities"]["tools"].empty());
    EXPECT_EQ(j["serverInfo"]["name"], "devops-mcp-server");
    EXPECT_EQ(j["serverInfo"]["version"], "1.0.0");
    EXPECT_FALSE(j.contains("instructions"));
    EXPECT_EQ(j.get<InitializeResult>(), r);
}
