#include "opsmcp/router.hpp"
#include "opsmcp/error.hpp"
#include "opsmcp/session.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace opsmcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg, Session& session) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return dispatch_request(*req, session);
    }
    dispatch_notification(std::get<JsonRpcNotification>(msg), session);
    return std::nullopt;
}

JsonRpcResponse Router::dispatch_request(const JsonRpcRequest& req, Session& session) {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(req.method);
        if (it == request_handlers_.end()) {
            spdlog::warn("Unknown method '{}' (id={}, session={})",
                         req.method, to_string(req.id), session.id());
            return make_error(req.id, error::InternalError, "Unknown method: " + req.method);
        }
        handler = it->second;
    }

    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    // Call handler WITHOUT holding the lock
    try {
        auto result = handler(params, session);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            JsonRpcResponse resp;
            resp.id = req.id;
            resp.error = std::move(*err);
            return resp;
        }
        return make_result(req.id, std::move(std::get<nlohmann::json>(result)));
    } catch (const McpProtocolError& e) {
        spdlog::warn("{} failed: {}", req.method, e.what());
        return make_error(req.id, e.code, e.what());
    } catch (const McpInvalidParamsError& e) {
        spdlog::warn("{} rejected arguments: {}", req.method, e.what());
        return make_error(req.id, error::InvalidParams, e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", req.method, e.what());
        return make_error(req.id, error::InternalError, e.what());
    } catch (...) {
        spdlog::error("{} failed with a non-standard exception", req.method);
        return make_error(req.id, error::InternalError, "Internal error");
    }
}

void Router::dispatch_notification(const JsonRpcNotification& notif, Session& session) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            spdlog::debug("Ignoring notification '{}'", notif.method);
            return;
        }
        handler = it->second;
    }
    const nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();
    try {
        handler(params, session);
    } catch (const std::exception& e) {
        // Notifications have no response to carry the failure
        spdlog::error("Notification '{}' failed: {}", notif.method, e.what());
    } catch (...) {
        spdlog::error("Notification '{}' failed with a non-standard exception", notif.method);
    }
}

} // namespace opsmcp
