#include "opsmcp/server.hpp"
#include "opsmcp/transport/http_transport.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace opsmcp {

// ----------- Server::Impl -----------

struct Server::Impl {
    ServerConfig config;
    ToolRegistry registry;
    SessionStore sessions;
    Dispatcher dispatcher;
    HttpServerTransport transport;

    // Idle-session sweeper
    std::thread sweeper;
    std::mutex sweeper_mutex;
    std::condition_variable sweeper_cv;
    bool sweeper_stop{false};

    std::atomic<bool> running{false};

    static SessionStore::Options store_options(const ServerConfig& c) {
        SessionStore::Options o;
        o.idle_ttl = c.session_ttl;
        return o;
    }

    static Dispatcher::Options dispatcher_options(const ServerConfig& c) {
        Dispatcher::Options o;
        o.tool_timeout = c.tool_timeout;
        return o;
    }

    static HttpServerTransport::Options transport_options(const ServerConfig& c) {
        HttpServerTransport::Options o;
        o.host = c.host;
        o.port = c.port;
        o.mcp_path = c.mcp_path;
        o.allowed_origins = c.allowed_origins;
        return o;
    }

    explicit Impl(ServerConfig c)
        : config(std::move(c))
        , sessions(store_options(config))
        , dispatcher(registry, dispatcher_options(config))
        , transport(transport_options(config), dispatcher, sessions) {}

    void start_sweeper() {
        if (config.session_ttl.count() <= 0 || config.sweep_interval.count() <= 0) return;
        {
            std::lock_guard<std::mutex> lock(sweeper_mutex);
            sweeper_stop = false;
        }
        sweeper = std::thread([this] {
            std::unique_lock<std::mutex> lock(sweeper_mutex);
            while (!sweeper_cv.wait_for(lock, config.sweep_interval, [this] { return sweeper_stop; })) {
                lock.unlock();
                sessions.evict_expired();
                lock.lock();
            }
        });
    }

    void stop_sweeper() {
        {
            std::lock_guard<std::mutex> lock(sweeper_mutex);
            sweeper_stop = true;
        }
        sweeper_cv.notify_all();
        if (sweeper.joinable()) sweeper.join();
    }
};

// ----------- Server -----------

Server::Server(ServerConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

Server::~Server() {
    if (impl_) {
        shutdown();
        impl_->stop_sweeper();
    }
}

ToolRegistry& Server::registry() {
    return impl_->registry;
}

SessionStore& Server::sessions() {
    return impl_->sessions;
}

Dispatcher& Server::dispatcher() {
    return impl_->dispatcher;
}

void Server::serve() {
    spdlog::info("Starting {} {} with {} tool(s)",
                 impl_->dispatcher.options().server_info.name,
                 impl_->dispatcher.options().server_info.version,
                 impl_->registry.size());
    impl_->running = true;
    impl_->start_sweeper();
    try {
        impl_->transport.start();
    } catch (...) {
        impl_->running = false;
        impl_->stop_sweeper();
        throw;
    }
    impl_->running = false;
    impl_->stop_sweeper();
    spdlog::info("Server stopped");
}

void Server::shutdown() {
    impl_->transport.shutdown();
}

bool Server::is_running() const {
    return impl_->running && impl_->transport.is_listening();
}

uint16_t Server::port() const {
    return impl_->transport.port();
}

} // namespace opsmcp
