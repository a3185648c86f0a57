#include "opsmcp/types.hpp"
#include <algorithm>
#include <stdexcept>

namespace opsmcp {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

// ---------- Content ----------

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- Schema ----------

InputSchema& InputSchema::property(std::string name, PropertySchema schema, bool is_required) {
    auto it = std::find_if(properties.begin(), properties.end(),
        [&name](const auto& p) { return p.first == name; });
    if (it != properties.end()) {
        it->second = std::move(schema);
    } else {
        properties.emplace_back(name, std::move(schema));
    }
    if (is_required && std::find(required.begin(), required.end(), name) == required.end()) {
        required.push_back(std::move(name));
    }
    return *this;
}

void to_json(nlohmann::json& j, const PropertySchema& t) {
    j = {{"type", t.type}};
    if (t.enum_values) j["enum"] = *t.enum_values;
    if (t.min_length) j["minLength"] = *t.min_length;
    if (t.max_length) j["maxLength"] = *t.max_length;
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, PropertySchema& t) {
    t.type = j.at("type").get<std::string>();
    if (j.contains("enum")) t.enum_values = j.at("enum").get<std::vector<std::string>>();
    if (j.contains("minLength")) t.min_length = j.at("minLength").get<size_t>();
    if (j.contains("maxLength")) t.max_length = j.at("maxLength").get<size_t>();
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
}

void to_json(nlohmann::json& j, const InputSchema& t) {
    nlohmann::json props = nlohmann::json::object();
    for (const auto& [name, schema] : t.properties) {
        props[name] = schema;
    }
    j = {{"type", t.type}, {"properties", props}};
    if (!t.required.empty()) j["required"] = t.required;
}

void from_json(const nlohmann::json& j, InputSchema& t) {
    t.type = j.value("type", std::string("object"));
    t.properties.clear();
    if (j.contains("properties")) {
        for (const auto& [name, schema] : j.at("properties").items()) {
            t.properties.emplace_back(name, schema.get<PropertySchema>());
        }
    }
    if (j.contains("required")) t.required = j.at("required").get<std::vector<std::string>>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    t.input_schema = j.at("inputSchema").get<InputSchema>();
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
    if (t.is_error) j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- Initialization ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

} // namespace opsmcp
