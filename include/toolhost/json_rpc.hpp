#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolhost {

/// Opaque request id. Each alternative keeps one JSON scalar kind so the
/// response carries back exactly the value the client sent.
using RequestId = std::variant<int64_t, uint64_t, double, std::string, std::nullptr_t>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()
        && j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        id = j.get<uint64_t>();
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_number_float()) {
        id = j.get<double>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else if (j.is_null()) {
        id = nullptr;
    } else {
        throw std::invalid_argument("RequestId must be a number, string or null");
    }
}

/// Extract the id to echo back. Numbers, strings and null are kept as sent;
/// arrays, objects and booleans count as absent.
std::optional<RequestId> request_id_from_json(const nlohmann::json& j);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

/// Every frame is a request; there are no notifications in this protocol subset.
struct JsonRpcRequest {
    std::optional<RequestId> id;
    std::optional<std::string> jsonrpc;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && jsonrpc == o.jsonrpc && method == o.method
               && params == o.params;
    }
};

/// Exactly one of result / error is set. id is absent for parse errors and
/// for requests that carried no usable id.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result);
JsonRpcResponse make_error(std::optional<RequestId> id, int code, std::string message);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace toolhost

// RequestId is a std::variant, so ADL cannot find toolhost::to_json/from_json;
// route nlohmann's conversions to them explicitly.
template <>
struct nlohmann::adl_serializer<toolhost::RequestId> {
    static void to_json(nlohmann::json& j, const toolhost::RequestId& id) {
        toolhost::to_json(j, id);
    }
    static void from_json(const nlohmann::json& j, toolhost::RequestId& id) {
        toolhost::from_json(j, id);
    }
};
