#include "opsmcp/config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace opsmcp {

namespace {

const char* getenv_or_null(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

long long parse_number(const char* key, const std::string& value, long long min, long long max) {
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(key) + ": not a number: " + value);
    }
    if (pos != value.size() || n < min || n > max) {
        throw std::invalid_argument(std::string(key) + ": out of range: " + value);
    }
    return n;
}

} // anonymous namespace

ServerConfig ServerConfig::from_env() {
    ServerConfig c;
    if (const char* v = getenv_or_null("HOST")) c.host = v;
    if (const char* v = getenv_or_null("PORT")) {
        c.port = static_cast<uint16_t>(parse_number("PORT", v, 1, 65535));
    }
    if (const char* v = getenv_or_null("OPSMCP_LOG_LEVEL")) c.log_level = v;
    if (const char* v = getenv_or_null("OPSMCP_SESSION_TTL")) {
        c.session_ttl = std::chrono::seconds(parse_number("OPSMCP_SESSION_TTL", v, 0, 7 * 24 * 3600));
    }
    if (const char* v = getenv_or_null("OPSMCP_TOOL_TIMEOUT_MS")) {
        c.tool_timeout = std::chrono::milliseconds(parse_number("OPSMCP_TOOL_TIMEOUT_MS", v, 0, 3600 * 1000));
    }
    return c;
}

void ServerConfig::bind(CLI::App& app) {
    app.add_option("--host", host, "Address to listen on")->capture_default_str();
    app.add_option("-p,--port", port, "TCP port")->capture_default_str()
        ->check(CLI::Range(1, 65535));
    app.add_option("--path", mcp_path, "HTTP path of the MCP endpoint")->capture_default_str();
    app.add_option("--allow-origin", allowed_origins,
                   "Accepted Origin header value (repeatable; none accepts all)");
    app.add_option_function<long long>("--session-ttl",
        [this](long long s) { session_ttl = std::chrono::seconds(s); },
        "Seconds an idle session is kept (0 keeps sessions forever)")
        ->check(CLI::NonNegativeNumber);
    app.add_option_function<long long>("--tool-timeout-ms",
        [this](long long ms) { tool_timeout = std::chrono::milliseconds(ms); },
        "Upper bound on one tool call in milliseconds (0 disables)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-l,--log-level", log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->capture_default_str();
}

void ServerConfig::apply_logging() const {
    auto level = spdlog::level::from_str(log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && log_level != "off") {
        throw std::invalid_argument("Invalid log level: " + log_level);
    }
    spdlog::set_level(level);
}

} // namespace opsmcp
