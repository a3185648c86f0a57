#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "version.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace opsmcp {

class Session;

/// Executes the initialize -> tools/list -> tools/call state machine for
/// one session. Every failure becomes a JSON-RPC error envelope.
class Dispatcher {
public:
    struct Options {
        Implementation server_info{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
        std::string protocol_version{PROTOCOL_VERSION};
        std::optional<std::string> instructions;
        // Upper bound on one tool invocation. Zero waits indefinitely.
        std::chrono::milliseconds tool_timeout{0};
    };

    explicit Dispatcher(const ToolRegistry& registry);
    Dispatcher(const ToolRegistry& registry, Options opts);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Requests yield a response whose id equals the request id.
    /// Notifications yield std::nullopt.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg, Session& session);

    /// Marks the session initialized and describes the server.
    InitializeResult initialize(Session& session) const;

    /// Promotes the session and returns every registered definition.
    std::vector<ToolDefinition> list_tools(Session& session) const;

    /// Promotes the session, invokes the named tool and waits for it.
    /// Throws McpToolNotFoundError, McpTimeoutError, or whatever the handler throws.
    CallToolResult call_tool(const std::string& name, const nlohmann::json& arguments,
                             Session& session) const;

    const Options& options() const { return opts_; }
    const ToolRegistry& registry() const { return registry_; }

private:
    void setup_handlers();

    const ToolRegistry& registry_;
    Options opts_;
    Router router_;
};

} // namespace opsmcp
