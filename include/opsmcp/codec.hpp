#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace opsmcp {

class Codec {
public:
    /// Parse raw JSON bytes into an inbound message.
    /// Throws McpParseError on invalid JSON or a malformed envelope.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse raw JSON bytes into a plain document (non JSON-RPC bodies).
    /// Throws McpParseError on invalid JSON.
    [[nodiscard]] static nlohmann::json parse_document(std::string_view raw);

    /// Validate an already decoded object as a JSON-RPC 2.0 request or notification.
    [[nodiscard]] static JsonRpcMessage parse_object(const nlohmann::json& j);

    /// Serialize a response to a JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

    /// Serialize a response as a single Server-Sent Events "message" event.
    [[nodiscard]] static std::string frame_sse(const JsonRpcResponse& resp);
};

} // namespace opsmcp
