#pragma once
#include "registry.hpp"
#include "worker_pool.hpp"
#include <future>
#include <string>

namespace toolhost {

/// Routes tools/call to registry handlers and contains their failures.
///
/// Every outcome is a CallToolResult: unknown tools, argument validation
/// failures and handler exceptions all come back with is_error set and an
/// "Error: ..." text, never as an exception.
class ToolDispatcher {
public:
    ToolDispatcher(const ToolRegistry& registry, WorkerPool& pool);

    /// Run the call on the worker pool. Unknown tools resolve immediately.
    [[nodiscard]] std::future<CallToolResult> dispatch(const std::string& name,
                                                       const nlohmann::json& arguments);

    /// Run the call on the calling thread.
    [[nodiscard]] CallToolResult invoke(const std::string& name,
                                        const nlohmann::json& arguments) const;

private:
    const ToolRegistry& registry_;
    WorkerPool& pool_;
};

} // namespace toolhost
