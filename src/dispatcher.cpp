#include "toolhost/dispatcher.hpp"
#include "toolhost/error.hpp"
#include "toolhost/logging.hpp"
#include "toolhost/schema.hpp"
#include <memory>

namespace toolhost {

namespace {

CallToolResult unknown_tool(const std::string& name) {
    return CallToolResult::error("Unknown tool: " + name);
}

CallToolResult run_tool(const ToolRegistry& registry, const std::string& name,
                        const nlohmann::json& arguments) {
    const auto* entry = registry.find(name);
    if (!entry) {
        logging::get()->warn("tools/call: unknown tool '{}'", name);
        return unknown_tool(name);
    }

    try {
        nlohmann::json args = validate_arguments(entry->definition.input_schema, arguments);
        if (entry->handler) {
            return entry->handler(args);
        }
        auto fut = entry->async_handler(args);
        return fut.get();
    } catch (const std::exception& e) {
        logging::get()->warn("tools/call {} failed: {}", name, e.what());
        return CallToolResult::error(e.what());
    } catch (...) {
        logging::get()->warn("tools/call {} failed with a non-standard exception", name);
        return CallToolResult::error("unknown failure");
    }
}

} // anonymous namespace

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry, WorkerPool& pool)
    : registry_(registry), pool_(pool) {
}

CallToolResult ToolDispatcher::invoke(const std::string& name,
                                      const nlohmann::json& arguments) const {
    return run_tool(registry_, name, arguments);
}

std::future<CallToolResult> ToolDispatcher::dispatch(const std::string& name,
                                                     const nlohmann::json& arguments) {
    if (!registry_.find(name)) {
        logging::get()->warn("tools/call: unknown tool '{}'", name);
        std::promise<CallToolResult> p;
        p.set_value(unknown_tool(name));
        return p.get_future();
    }

    auto task = std::make_shared<std::packaged_task<CallToolResult()>>(
        [registry = &registry_, name, arguments]() { return run_tool(*registry, name, arguments); });
    auto fut = task->get_future();
    pool_.post([task]() { (*task)(); });
    return fut;
}

} // namespace toolhost
