#include "opsmcp/codec.hpp"
#include "opsmcp/error.hpp"
#include "opsmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace opsmcp {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalar documents ("1", "\"x\"") cannot be read through get_value().
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    if (doc.is_scalar()) {
        throw McpParseError("Message must be a JSON object");
    }
    auto val = doc.get_value();
    if (val.error()) {
        throw McpParseError("Failed to get document value");
    }
    return simdjson_to_nlohmann(val.value());
}

} // anonymous namespace

nlohmann::json Codec::parse_document(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        // simdjson reports errors found late in the document as exceptions
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    return j;
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'");
    }
    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        throw McpParseError("Missing or non-string 'method' field");
    }

    std::optional<nlohmann::json> params;
    if (auto it = j.find("params"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw McpParseError("'params' must be an object");
        }
        params = *it;
    }

    if (!j.contains("id")) {
        JsonRpcNotification notif;
        notif.method = method->get<std::string>();
        notif.params = std::move(params);
        return notif;
    }

    JsonRpcRequest req;
    try {
        from_json(j.at("id"), req.id);
    } catch (const std::invalid_argument&) {
        throw McpParseError("Request ID must be an integer or a string");
    }
    req.method = method->get<std::string>();
    req.params = std::move(params);
    return req;
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return parse_object(parse_document(raw));
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::frame_sse(const JsonRpcResponse& resp) {
    return "event: message\ndata: " + serialize(resp) + "\n\n";
}

} // namespace opsmcp
