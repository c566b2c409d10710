#include "mcpserve/json_rpc.hpp"
#include "mcpserve/version.hpp"

namespace mcpserve {

JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(std::optional<RequestId> id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j = nullptr;
    if (r.id) to_json(id_j, *r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    if (j.contains("id") && !j.at("id").is_null()) {
        RequestId id;
        from_json(j.at("id"), id);
        r.id = std::move(id);
    }
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace mcpserve
