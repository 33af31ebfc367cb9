#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace toolhost {

class Codec {
public:
    /// Parse one frame into a request.
    /// Throws ParseError if the frame is not valid JSON or not a JSON object.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view frame);

    /// Parse one frame into a generic JSON value (used by clients and tests).
    [[nodiscard]] static nlohmann::json parse_json(std::string_view frame);

    /// Serialize a response to a single line of minified JSON (no newline).
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
    [[nodiscard]] static std::string serialize(const JsonRpcRequest& req);
};

} // namespace toolhost
