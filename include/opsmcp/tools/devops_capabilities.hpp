#pragma once
#include "../tool_registry.hpp"
#include "../types.hpp"

namespace opsmcp::tools {

/// Advertised definition of the "devops_capabilities" tool.
ToolDefinition devops_capabilities_definition();

/// Report sample DevOps data for a two-letter state code, or an overview
/// when no state is given. Throws McpInvalidParamsError on a malformed state.
CallToolResult devops_capabilities(const nlohmann::json& arguments);

/// Register every built-in tool.
void register_builtin_tools(ToolRegistry& registry);

} // namespace opsmcp::tools
