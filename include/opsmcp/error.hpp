#pragma once
#include <stdexcept>
#include <string>

namespace opsmcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised by the codec when bytes do not form a JSON-RPC 2.0 message.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpToolNotFoundError : public McpProtocolError {
public:
    std::string tool;
    McpToolNotFoundError(int code, const std::string& name)
        : McpProtocolError(code, "Tool " + name + " not found"), tool(name) {}
};

/// Raised by tool handlers when their arguments fail validation.
class McpInvalidParamsError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpTimeoutError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace error

} // namespace opsmcp
