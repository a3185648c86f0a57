#include "opsmcp/dispatcher.hpp"
#include "opsmcp/error.hpp"
#include "opsmcp/session.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <thread>

namespace opsmcp {

namespace {

void promote(Session& session) {
    if (session.mark_initialized()) {
        spdlog::debug("Session {} auto-initialized", session.id());
    }
}

} // anonymous namespace

Dispatcher::Dispatcher(const ToolRegistry& registry)
    : Dispatcher(registry, Options{}) {
}

Dispatcher::Dispatcher(const ToolRegistry& registry, Options opts)
    : registry_(registry)
    , opts_(std::move(opts)) {
    setup_handlers();
}

void Dispatcher::setup_handlers() {
    // initialize
    router_.on_request("initialize", [this](const nlohmann::json&, Session& session) -> HandlerResult {
        nlohmann::json j;
        to_json(j, initialize(session));
        return j;
    });

    // notifications/initialized
    router_.on_notification("notifications/initialized", [](const nlohmann::json&, Session& session) {
        promote(session);
    });

    // tools/list
    router_.on_request("tools/list", [this](const nlohmann::json&, Session& session) -> HandlerResult {
        return nlohmann::json{{"tools", list_tools(session)}};
    });

    // tools/call
    router_.on_request("tools/call", [this](const nlohmann::json& params, Session& session) -> HandlerResult {
        // Reject before touching the session
        auto name = params.find("name");
        if (name == params.end() || !name->is_string()) {
            return JsonRpcError{error::InternalError, "Missing required parameter: name", std::nullopt};
        }
        nlohmann::json arguments = nlohmann::json::object();
        if (auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
            if (!it->is_object()) {
                return JsonRpcError{error::InvalidParams, "Tool arguments must be an object", std::nullopt};
            }
            arguments = *it;
        }

        nlohmann::json j;
        to_json(j, call_tool(name->get<std::string>(), arguments, session));
        return j;
    });
}

std::optional<JsonRpcResponse> Dispatcher::dispatch(const JsonRpcMessage& msg, Session& session) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        spdlog::debug("Dispatching {} (id={}, session={})", req->method, to_string(req->id), session.id());
    }
    return router_.dispatch(msg, session);
}

InitializeResult Dispatcher::initialize(Session& session) const {
    if (session.mark_initialized()) {
        spdlog::info("Session {} initialized", session.id());
    }
    InitializeResult result;
    result.protocol_version = opts_.protocol_version;
    result.capabilities.tools = nlohmann::json::object();
    result.server_info = opts_.server_info;
    result.instructions = opts_.instructions;
    return result;
}

std::vector<ToolDefinition> Dispatcher::list_tools(Session& session) const {
    promote(session);
    return registry_.list();
}

CallToolResult Dispatcher::call_tool(const std::string& name, const nlohmann::json& arguments,
                                     Session& session) const {
    promote(session);

    const ToolDescriptor* tool = registry_.find(name);
    if (!tool) {
        throw McpToolNotFoundError(error::InternalError, name);
    }

    spdlog::debug("Calling tool {} with {}", name, arguments.dump());
    std::future<CallToolResult> fut = tool->handler(arguments);
    if (!fut.valid()) {
        throw McpError("Tool " + name + " returned no result");
    }
    if (opts_.tool_timeout.count() > 0 &&
        fut.wait_for(opts_.tool_timeout) == std::future_status::timeout) {
        // A std::async future blocks in its destructor; let a detached thread own it
        std::thread([abandoned = std::move(fut)]() mutable { abandoned.wait(); }).detach();
        throw McpTimeoutError("Tool " + name + " timed out after " +
                              std::to_string(opts_.tool_timeout.count()) + " ms");
    }
    return fut.get();
}

} // namespace opsmcp
