#pragma once
#include "types.hpp"
#include <functional>
#include <future>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolhost {

/// Handler types. A handler receives arguments already validated against the
/// tool's input schema, with defaults applied.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;
using AsyncToolHandler = std::function<std::future<CallToolResult>(const nlohmann::json& arguments)>;

/// Frozen table of tools. Populated through Builder before serving starts;
/// nothing can be added, removed or changed afterwards.
class ToolRegistry {
public:
    struct Entry {
        ToolDefinition definition;
        ToolHandler handler;
        AsyncToolHandler async_handler;
    };

    class Builder {
    public:
        Builder& add(ToolDefinition def, ToolHandler handler);
        Builder& add_async(ToolDefinition def, AsyncToolHandler handler);

        [[nodiscard]] ToolRegistry build();

    private:
        void check_name(const std::string& name) const;

        std::vector<Entry> entries_;
    };

    /// An empty registry.
    ToolRegistry() = default;

    /// Descriptors in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& list() const { return definitions_; }

    /// The "tools" array as sent in tools/list, serialized once.
    [[nodiscard]] const nlohmann::json& list_json() const { return list_json_; }

    /// nullptr if no tool has this name.
    [[nodiscard]] const Entry* find(const std::string& name) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    explicit ToolRegistry(std::vector<Entry> entries);

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<ToolDefinition> definitions_;
    nlohmann::json list_json_ = nlohmann::json::array();
};

} // namespace toolhost
