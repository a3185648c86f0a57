#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace opsmcp {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const {
        return text == o.text;
    }
};

using Content = std::variant<TextContent>;

// ---------- Schema ----------

/// One entry of an input schema's "properties" map.
struct PropertySchema {
    std::string type;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> enum_values;
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;

    bool operator==(const PropertySchema& o) const {
        return type == o.type && description == o.description
               && enum_values == o.enum_values && min_length == o.min_length
               && max_length == o.max_length;
    }
};

/// JSON-Schema-like description of a tool's arguments.
/// Advertised to clients only; nothing in the server enforces it.
struct InputSchema {
    std::string type = "object";
    std::vector<std::pair<std::string, PropertySchema>> properties;  // declaration order
    std::vector<std::string> required;

    InputSchema& property(std::string name, PropertySchema schema, bool is_required = false);

    bool operator==(const InputSchema& o) const {
        return type == o.type && properties == o.properties && required == o.required;
    }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    InputSchema input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

// ---------- Initialization ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const PropertySchema& t);
void from_json(const nlohmann::json& j, PropertySchema& t);

void to_json(nlohmann::json& j, const InputSchema& t);
void from_json(const nlohmann::json& j, InputSchema& t);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace opsmcp
