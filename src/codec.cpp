#include "mcpserve/codec.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpserve {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
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
            // Try integer first, then double
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

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        throw McpParseError("Failed to get document value");
    }
    return simdjson_to_nlohmann(val.value());
}

[[noreturn]] void invalid_request(const std::string& why) {
    throw McpProtocolError(error::InvalidRequest, "Invalid Request: " + why);
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
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
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }
    if (!doc.at_end()) {
        throw McpParseError("JSON parse error: trailing content");
    }
    return j;
}

std::optional<RequestId> Codec::extract_id(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return RequestId{it->get<int64_t>()};
    if (it->is_string()) return RequestId{it->get<std::string>()};
    return std::nullopt;
}

JsonRpcMessage Codec::to_message(const nlohmann::json& j) {
    if (!j.is_object()) {
        invalid_request("message must be a JSON object");
    }
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get<std::string>() != JSONRPC_VERSION) {
        invalid_request("'jsonrpc' must be \"2.0\"");
    }

    auto id_it = j.find("id");
    bool has_id = id_it != j.end() && !id_it->is_null();
    if (has_id && !id_it->is_number_integer() && !id_it->is_string()) {
        invalid_request("'id' must be an integer or a string");
    }

    auto method_it = j.find("method");
    if (method_it != j.end()) {
        if (!method_it->is_string()) {
            invalid_request("'method' must be a string");
        }
        if (has_id) {
            JsonRpcRequest req;
            from_json(*id_it, req.id);
            req.method = method_it->get<std::string>();
            if (j.contains("params")) req.params = j.at("params");
            return req;
        }
        JsonRpcNotification notif;
        notif.method = method_it->get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }

    if (has_id && (j.contains("result") || j.contains("error"))) {
        JsonRpcResponse resp;
        try {
            from_json(j, resp);
        } catch (const std::exception& e) {
            invalid_request(e.what());
        }
        return resp;
    }
    invalid_request("missing 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return to_message(parse_json(raw));
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);

    nlohmann::ordered_json out;
    for (const char* key : {"jsonrpc", "id", "method", "params", "result", "error"}) {
        auto it = j.find(key);
        if (it != j.end()) out[key] = nlohmann::ordered_json(*it);
    }
    return out.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace mcpserve
