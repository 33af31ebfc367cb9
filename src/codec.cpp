#include "toolhost/codec.hpp"
#include "toolhost/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace toolhost {

namespace {

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
        case simdjson::ondemand::json_type::null: {
            bool is_null = val.is_null();
            if (!is_null) throw ParseError("Invalid literal");
            return nlohmann::json(nullptr);
        }
        default:
            throw ParseError("unexpected JSON value");
    }
}

// Frames must hold a single JSON object; scalars and arrays are rejected
// before conversion.
nlohmann::json parse_object(std::string_view frame) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(frame.data(), frame.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(simdjson::error_message(error));
    }

    simdjson::ondemand::json_type type;
    error = doc.type().get(type);
    if (error) {
        throw ParseError(simdjson::error_message(error));
    }
    if (type != simdjson::ondemand::json_type::object) {
        throw ParseError("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        error = doc.get_value().get(root);
        if (error) throw ParseError(simdjson::error_message(error));
        j = simdjson_to_nlohmann(root);
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(e.what());
    }

    if (!doc.at_end()) {
        throw ParseError("Trailing content after JSON object");
    }
    return j;
}

} // anonymous namespace

JsonRpcRequest Codec::parse(std::string_view frame) {
    if (frame.empty()) {
        throw ParseError("Empty input");
    }
    nlohmann::json j = parse_object(frame);
    JsonRpcRequest req;
    from_json(j, req);
    return req;
}

nlohmann::json Codec::parse_json(std::string_view frame) {
    if (frame.empty()) {
        throw ParseError("Empty input");
    }
    return parse_object(frame);
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::serialize(const JsonRpcRequest& req) {
    nlohmann::json j;
    to_json(j, req);
    return j.dump();
}

} // namespace toolhost
