#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace opsmcp {

/// Runtime settings of the server process.
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3002;
    std::string mcp_path = "/mcp";
    std::vector<std::string> allowed_origins;

    std::chrono::seconds session_ttl{std::chrono::minutes(30)};
    std::chrono::seconds sweep_interval{60};
    std::chrono::milliseconds tool_timeout{30000};

    std::string log_level = "info";

    /// Defaults overridden by HOST, PORT, OPSMCP_LOG_LEVEL,
    /// OPSMCP_SESSION_TTL (seconds) and OPSMCP_TOOL_TIMEOUT_MS.
    /// Throws std::invalid_argument on a malformed value.
    static ServerConfig from_env();

    /// Register command-line flags that write into this config.
    void bind(CLI::App& app);

    /// Apply log_level to the default spdlog logger.
    /// Throws std::invalid_argument on an unknown level name.
    void apply_logging() const;
};

} // namespace opsmcp
