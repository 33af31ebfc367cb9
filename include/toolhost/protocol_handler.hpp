#pragma once
#include "dispatcher.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "version.hpp"
#include <future>
#include <string>
#include <string_view>

namespace toolhost {

/// The closed set of methods this server answers.
enum class Method {
    Initialize,
    ToolsList,
    ToolsCall,
    Unknown
};

[[nodiscard]] Method method_from_string(std::string_view name);
[[nodiscard]] std::string_view method_to_string(Method method);

/// Turns one frame into one response.
///
/// initialize and tools/list resolve immediately. tools/call resolves when
/// the dispatched tool finishes. The returned futures are deferred: the
/// caller that get()s them (the session's writer) is the one that waits.
class ProtocolHandler {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version = std::string(PROTOCOL_VERSION);
    };

    ProtocolHandler(Options opts, const ToolRegistry& registry, ToolDispatcher& dispatcher);

    /// Parse and handle a frame; yields the serialized response line
    /// (without the trailing newline). Never throws from get().
    [[nodiscard]] std::future<std::string> handle_frame(std::string_view frame);

    /// Handle an already parsed request.
    [[nodiscard]] std::future<JsonRpcResponse> handle(const JsonRpcRequest& req);

private:
    JsonRpcResponse on_initialize(const JsonRpcRequest& req) const;
    JsonRpcResponse on_tools_list(const JsonRpcRequest& req) const;
    std::future<JsonRpcResponse> on_tools_call(const JsonRpcRequest& req);

    Options opts_;
    const ToolRegistry& registry_;
    ToolDispatcher& dispatcher_;
};

} // namespace toolhost
