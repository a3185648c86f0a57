#include "opsmcp/transport/http_transport.hpp"
#include "opsmcp/codec.hpp"
#include "opsmcp/dispatcher.hpp"
#include "opsmcp/error.hpp"
#include "opsmcp/session.hpp"
#include "opsmcp/version.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>

namespace opsmcp {

namespace {

std::optional<std::string> session_header(const httplib::Request& req) {
    std::string id = req.get_header_value(SESSION_HEADER);
    if (id.empty()) return std::nullopt;
    return id;
}

void reply_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void reply_rpc_error(httplib::Response& res, int code, const std::string& message) {
    reply_json(res, 400, {
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", nullptr},
        {"error", {{"code", code}, {"message", message}}}
    });
}

bool wants_event_stream(const httplib::Request& req) {
    return req.get_header_value("Accept").find("text/event-stream") != std::string::npos;
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts, Dispatcher& dispatcher, SessionStore& sessions)
    : opts_(std::move(opts))
    , dispatcher_(dispatcher)
    , sessions_(sessions)
    , server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
        != opts_.allowed_origins.end();
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.mcp_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        // Validate Origin header for DNS rebinding protection
        auto origin = req.get_header_value("Origin");
        if (!origin.empty() && !validate_origin(origin)) {
            spdlog::warn("Rejected POST from origin {}", origin);
            reply_json(res, 403, {{"error", "Invalid origin"}});
            return;
        }
        try {
            handle_post(req, res);
        } catch (const std::exception& e) {
            spdlog::error("MCP server error on POST {}: {}", req.path, e.what());
            reply_json(res, 500, {{"error", "Internal server error"}});
        }
    });

    server_->Get(path, [this](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (!origin.empty() && !validate_origin(origin)) {
            spdlog::warn("Rejected GET from origin {}", origin);
            reply_json(res, 403, {{"error", "Invalid origin"}});
            return;
        }
        try {
            handle_get(req, res);
        } catch (const std::exception& e) {
            spdlog::error("MCP server error on GET {}: {}", req.path, e.what());
            reply_json(res, 500, {{"error", "Internal server error"}});
        }
    });
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    try {
        body = Codec::parse_document(req.body);
    } catch (const McpParseError& e) {
        spdlog::warn("Rejected malformed body: {}", e.what());
        reply_rpc_error(res, error::ParseError, e.what());
        return;
    }

    if (!body.contains("jsonrpc")) {
        handle_call_tool_action(req, body, res);
        return;
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::parse_object(body);
    } catch (const McpParseError& e) {
        spdlog::warn("Rejected invalid JSON-RPC envelope: {}", e.what());
        reply_rpc_error(res, error::InvalidRequest, e.what());
        return;
    }

    auto session = sessions_.get_or_create(session_header(req));
    res.set_header(SESSION_HEADER, session->id());

    auto response = dispatcher_.dispatch(msg, *session);
    if (!response) {
        // Notification: accepted, nothing to return
        res.status = 202;
        return;
    }

    if (wants_event_stream(req)) {
        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_content(Codec::frame_sse(*response), "text/event-stream");
    } else {
        res.set_content(Codec::serialize(*response), "application/json");
    }
}

void HttpServerTransport::handle_call_tool_action(const httplib::Request& req,
                                                  const nlohmann::json& body,
                                                  httplib::Response& res) {
    auto tool_name = body.find("toolName");
    if (body.value("action", std::string()) != "call-tool" ||
        tool_name == body.end() || !tool_name->is_string()) {
        reply_json(res, 400, {{"error", "Invalid request"}});
        return;
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto it = body.find("arguments"); it != body.end() && !it->is_null()) {
        arguments = *it;
    }

    auto session = sessions_.get_or_create(session_header(req));
    res.set_header(SESSION_HEADER, session->id());

    try {
        auto result = dispatcher_.call_tool(tool_name->get<std::string>(), arguments, *session);
        reply_json(res, 200, {{"result", result}});
    } catch (const McpToolNotFoundError& e) {
        reply_json(res, 404, {{"error", e.what()}});
    } catch (const McpInvalidParamsError& e) {
        reply_json(res, 400, {{"error", e.what()}});
    }
}

void HttpServerTransport::handle_get(const httplib::Request& req, httplib::Response& res) {
    const std::string action = req.get_param_value("action");

    if (action == "status") {
        if (auto id = session_header(req)) {
            res.set_header(SESSION_HEADER, *id);
        }
        const auto& info = dispatcher_.options().server_info;
        reply_json(res, 200, {
            {"status", "running"},
            {"server", info.name},
            {"version", info.version},
            {"sessions", sessions_.size()}
        });
    } else if (action == "list-tools") {
        auto session = sessions_.get_or_create(session_header(req));
        res.set_header(SESSION_HEADER, session->id());
        if (!session->initialized()) {
            reply_json(res, 400, {{"error", "Session not initialized"}});
            return;
        }
        reply_json(res, 200, {{"tools", dispatcher_.registry().list()}});
    } else if (action == "new-session") {
        auto session = sessions_.get_or_create(std::nullopt);
        res.set_header(SESSION_HEADER, session->id());
        reply_json(res, 200, {
            {"sessionId", session->id()},
            {"message", "New session created"}
        });
    } else {
        reply_json(res, 400, {{"error", "Invalid action"}});
    }
}

void HttpServerTransport::start() {
    if (running_.exchange(true)) return;

    int port = opts_.port == 0 ? server_->bind_to_any_port(opts_.host)
                               : (server_->bind_to_port(opts_.host, opts_.port) ? opts_.port : -1);
    if (port <= 0) {
        running_ = false;
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host + ":" +
                                std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);
    spdlog::info("Listening on http://{}:{}{}", opts_.host, bound_port_.load(), opts_.mcp_path);

    // Blocks until stop()
    if (!server_->listen_after_bind() && running_) {
        running_ = false;
        throw McpTransportError("HTTP listener on port " + std::to_string(port) + " failed");
    }
    running_ = false;
}

void HttpServerTransport::shutdown() {
    if (!running_.exchange(false)) return;
    server_->stop();
}

bool HttpServerTransport::is_listening() const {
    return running_ && server_->is_running();
}

} // namespace opsmcp
