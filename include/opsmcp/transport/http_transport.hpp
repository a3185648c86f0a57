#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace opsmcp {

class Dispatcher;
class SessionStore;

/// Header carrying the opaque session token in both directions.
constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

/// HTTP binding of the dispatcher.
///
///   POST <path>  JSON-RPC request or notification; the response is framed as
///                Server-Sent Events when the client accepts text/event-stream,
///                plain JSON otherwise. Also accepts the convenience body
///                {"action":"call-tool","toolName":..,"arguments":..}.
///   GET  <path>  ?action=status | list-tools | new-session
///
/// Bodies that are not valid JSON-RPC are rejected with 400 before any
/// session is looked up.
class HttpServerTransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 3002;  // 0 binds an ephemeral port
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;
    };

    HttpServerTransport(Options opts, Dispatcher& dispatcher, SessionStore& sessions);
    ~HttpServerTransport();

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Bind and serve. Blocks until shutdown(); throws McpTransportError
    /// when the address cannot be bound.
    void start();
    void shutdown();

    /// True once the listener accepts connections.
    [[nodiscard]] bool is_listening() const;

    /// Port actually bound (differs from Options::port when that was 0).
    [[nodiscard]] uint16_t port() const { return bound_port_; }

private:
    bool validate_origin(const std::string& origin) const;
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_get(const httplib::Request& req, httplib::Response& res);
    void handle_call_tool_action(const httplib::Request& req, const nlohmann::json& body,
                                 httplib::Response& res);

    Options opts_;
    Dispatcher& dispatcher_;
    SessionStore& sessions_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
};

} // namespace opsmcp
