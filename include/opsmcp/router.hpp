#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <mutex>

namespace opsmcp {

class Session;

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params, Session& session)>;
using NotificationHandler = std::function<void(const nlohmann::json& params, Session& session)>;

/// Method table plus the exception boundary: nothing thrown by a handler
/// escapes dispatch().
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an inbound message. Requests always yield a response carrying
    /// the request id; notifications never do.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg, Session& session);

private:
    JsonRpcResponse dispatch_request(const JsonRpcRequest& req, Session& session);
    void dispatch_notification(const JsonRpcNotification& notif, Session& session);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace opsmcp
