#pragma once
#include "types.hpp"
#include <functional>
#include <future>
#include <string>
#include <unordered_map>
#include <vector>

namespace opsmcp {

/// Blocking tool implementation.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Tool implementation that completes asynchronously.
using AsyncToolHandler = std::function<std::future<CallToolResult>(const nlohmann::json& arguments)>;

struct ToolDescriptor {
    ToolDefinition definition;
    AsyncToolHandler handler;
};

/// Name -> descriptor map, populated at startup and read-only afterwards.
/// Listing order is registration order. Not synchronized: finish all
/// registrations before the registry is shared with request threads.
class ToolRegistry {
public:
    /// Register a blocking handler. Each invocation runs on its own worker
    /// thread so callers always get a future they can wait on with a deadline.
    void register_tool(ToolDefinition def, ToolHandler handler);

    /// Register a handler that already returns a future.
    void register_tool_async(ToolDefinition def, AsyncToolHandler handler);

    /// nullptr when no tool has that name.
    [[nodiscard]] const ToolDescriptor* find(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    /// Advertised definitions in registration order.
    [[nodiscard]] std::vector<ToolDefinition> list() const;

    [[nodiscard]] size_t size() const { return descriptors_.size(); }

private:
    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace opsmcp
