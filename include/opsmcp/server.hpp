#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include <cstdint>
#include <memory>

namespace opsmcp {

/// Owns the tool registry, the session store and the dispatcher, and serves
/// them over HTTP. Register tools through registry() before serve().
class Server {
public:
    explicit Server(ServerConfig config);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ToolRegistry& registry();
    SessionStore& sessions();
    Dispatcher& dispatcher();

    /// Serve until shutdown(). Also runs the idle-session sweeper.
    /// Throws McpTransportError when the listener cannot be started.
    void serve();
    void shutdown();

    [[nodiscard]] bool is_running() const;

    /// Bound port once is_running(); 0 before.
    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace opsmcp
