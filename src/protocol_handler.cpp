#include "toolhost/protocol_handler.hpp"
#include "toolhost/codec.hpp"
#include "toolhost/error.hpp"
#include "toolhost/logging.hpp"

namespace toolhost {

namespace {

std::future<JsonRpcResponse> ready(JsonRpcResponse resp) {
    std::promise<JsonRpcResponse> p;
    p.set_value(std::move(resp));
    return p.get_future();
}

std::string describe_id(const std::optional<RequestId>& id) {
    if (!id) return "none";
    nlohmann::json j;
    to_json(j, *id);
    return j.dump();
}

} // anonymous namespace

Method method_from_string(std::string_view name) {
    if (name == "initialize") return Method::Initialize;
    if (name == "tools/list") return Method::ToolsList;
    if (name == "tools/call") return Method::ToolsCall;
    return Method::Unknown;
}

std::string_view method_to_string(Method method) {
    switch (method) {
        case Method::Initialize: return "initialize";
        case Method::ToolsList:  return "tools/list";
        case Method::ToolsCall:  return "tools/call";
        case Method::Unknown:    break;
    }
    return "unknown";
}

ProtocolHandler::ProtocolHandler(Options opts, const ToolRegistry& registry,
                                 ToolDispatcher& dispatcher)
    : opts_(std::move(opts)), registry_(registry), dispatcher_(dispatcher) {
}

std::future<std::string> ProtocolHandler::handle_frame(std::string_view frame) {
    JsonRpcRequest req;
    try {
        req = Codec::parse(frame);
    } catch (const ParseError& e) {
        logging::get()->warn("Dropping malformed frame: {}", e.what());
        std::promise<std::string> p;
        p.set_value(Codec::serialize(
            make_error(std::nullopt, error::ParseError, std::string("Parse error: ") + e.what())));
        return p.get_future();
    }

    logging::get()->debug("<- {} id={}", req.method, describe_id(req.id));

    std::future<JsonRpcResponse> pending;
    try {
        pending = handle(req);
    } catch (const std::exception& e) {
        logging::get()->error("Failed to handle {}: {}", req.method, e.what());
        pending = ready(make_error(req.id, error::InternalError, e.what()));
    }

    return std::async(std::launch::deferred,
        [id = req.id, pending = std::move(pending)]() mutable -> std::string {
            try {
                return Codec::serialize(pending.get());
            } catch (const std::exception& e) {
                logging::get()->error("Failed to build response: {}", e.what());
                return Codec::serialize(make_error(id, error::InternalError, e.what()));
            }
        });
}

std::future<JsonRpcResponse> ProtocolHandler::handle(const JsonRpcRequest& req) {
    switch (method_from_string(req.method)) {
        case Method::Initialize:
            return ready(on_initialize(req));
        case Method::ToolsList:
            return ready(on_tools_list(req));
        case Method::ToolsCall:
            return on_tools_call(req);
        case Method::Unknown:
            break;
    }
    return ready(make_error(req.id, error::MethodNotFound, "Method not found: " + req.method));
}

JsonRpcResponse ProtocolHandler::on_initialize(const JsonRpcRequest& req) const {
    InitializeResult result;
    result.protocol_version = opts_.protocol_version;
    result.server_info = opts_.server_info;

    nlohmann::json j;
    to_json(j, result);
    return make_result(req.id, std::move(j));
}

JsonRpcResponse ProtocolHandler::on_tools_list(const JsonRpcRequest& req) const {
    return make_result(req.id, nlohmann::json{{"tools", registry_.list_json()}});
}

std::future<JsonRpcResponse> ProtocolHandler::on_tools_call(const JsonRpcRequest& req) {
    nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    std::string name;
    if (params.is_object() && params.contains("name") && params.at("name").is_string()) {
        name = params.at("name").get<std::string>();
    }
    nlohmann::json arguments = nlohmann::json::object();
    if (params.is_object() && params.contains("arguments")) {
        arguments = params.at("arguments");
    }

    auto outcome = dispatcher_.dispatch(name, arguments);
    return std::async(std::launch::deferred,
        [id = req.id, outcome = std::move(outcome)]() mutable {
            nlohmann::json j;
            to_json(j, outcome.get());
            return make_result(id, std::move(j));
        });
}

} // namespace toolhost
