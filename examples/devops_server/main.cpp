/// DevOps MCP server.
/// Usage: ./devops_server [--port 3002] [--log-level debug]
/// Serves JSON-RPC over HTTP POST on /mcp.

#include <opsmcp/opsmcp.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include <iostream>

namespace {
    // Only this flag is touched from the signal handler
    std::atomic<int> pending_signal{0};

    void signal_handler(int signal) {
        pending_signal = signal;
    }

    // Stops the server once a signal arrives; joined when serve() returns.
    class ShutdownWatcher {
    public:
        explicit ShutdownWatcher(opsmcp::Server& server)
            : thread_([this, &server] {
                  while (!done_) {
                      if (int sig = pending_signal.exchange(0)) {
                          spdlog::info("Received signal {}, shutting down", sig);
                          server.shutdown();
                      }
                      std::this_thread::sleep_for(std::chrono::milliseconds(100));
                  }
              }) {}

        ~ShutdownWatcher() {
            done_ = true;
            thread_.join();
        }

    private:
        std::atomic<bool> done_{false};
        std::thread thread_;
    };
}

int main(int argc, char** argv) {
    CLI::App app{"DevOps MCP Server - tool invocation over JSON-RPC"};

    opsmcp::ServerConfig config;
    try {
        config = opsmcp::ServerConfig::from_env();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid environment: " << e.what() << std::endl;
        return 1;
    }
    config.bind(app);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << opsmcp::SERVER_NAME << " version " << opsmcp::SERVER_VERSION << std::endl;
        return 0;
    }

    try {
        config.apply_logging();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    try {
        opsmcp::Server server{config};
        opsmcp::tools::register_builtin_tools(server.registry());

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        ShutdownWatcher watcher(server);

        // Blocks until shutdown
        server.serve();
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
