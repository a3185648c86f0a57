#include "opsmcp/tools/devops_capabilities.hpp"
#include "opsmcp/error.hpp"
#include <algorithm>
#include <cctype>

namespace opsmcp::tools {

ToolDefinition devops_capabilities_definition() {
    ToolDefinition def;
    def.name = "devops_capabilities";
    def.description = "Get DevOps Capabilities";

    PropertySchema state;
    state.type = "string";
    state.min_length = 2;
    state.max_length = 2;
    state.description = "Two-letter state code (e.g. CA, NY)";
    def.input_schema.property("state", std::move(state), true);
    return def;
}

CallToolResult devops_capabilities(const nlohmann::json& arguments) {
    CallToolResult result;

    auto it = arguments.find("state");
    if (it == arguments.end() || it->is_null()) {
        result.content.push_back(TextContent{
            "DevOps capabilities overview:\n\n"
            "Pass a two-letter state code as 'state' to get active alerts "
            "and sample DevOps data for that state."});
        return result;
    }

    if (!it->is_string()) {
        throw McpInvalidParamsError("'state' must be a string");
    }
    std::string code = it->get<std::string>();
    if (code.size() != 2 ||
        !std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isalpha(c); })) {
        throw McpInvalidParamsError("'state' must be a two-letter state code, got '" + code + "'");
    }
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    result.content.push_back(TextContent{
        "Active alerts for " + code + ":\n\nSample DevOps data for " + code});
    return result;
}

void register_builtin_tools(ToolRegistry& registry) {
    registry.register_tool(devops_capabilities_definition(), devops_capabilities);
}

} // namespace opsmcp::tools
