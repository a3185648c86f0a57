#include "opsmcp/json_rpc.hpp"
#include "opsmcp/version.hpp"

namespace opsmcp {

std::string to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(id) + "\"";
}

JsonRpcResponse make_result(RequestId id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(RequestId id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

} // namespace opsmcp
