#include "toolhost/json_rpc.hpp"
#include "toolhost/version.hpp"

namespace toolhost {

std::optional<RequestId> request_id_from_json(const nlohmann::json& j) {
    if (j.is_array() || j.is_object() || j.is_boolean() || j.is_discarded()) return std::nullopt;
    RequestId id;
    from_json(j, id);
    return id;
}

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
    j = nlohmann::json::object();
    j["jsonrpc"] = r.jsonrpc ? *r.jsonrpc : std::string(JSONRPC_VERSION);
    if (r.id) {
        nlohmann::json id_j;
        to_json(id_j, *r.id);
        j["id"] = id_j;
    }
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    if (j.contains("id")) r.id = request_id_from_json(j.at("id"));
    if (j.contains("jsonrpc")) {
        const auto& v = j.at("jsonrpc");
        r.jsonrpc = v.is_string() ? v.get<std::string>() : std::string();
    }
    if (j.contains("method") && j.at("method").is_string()) {
        r.method = j.at("method").get<std::string>();
    }
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.id) {
        nlohmann::json id_j;
        to_json(id_j, *r.id);
        j["id"] = id_j;
    }
    if (r.error) {
        j["error"] = *r.error;
    } else if (r.result) {
        j["result"] = *r.result;
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    if (j.contains("id")) r.id = request_id_from_json(j.at("id"));
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

} // namespace toolhost
