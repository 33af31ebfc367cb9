#include "toolhost/registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace toolhost {

// ----------- Builder -----------

void ToolRegistry::Builder::check_name(const std::string& name) const {
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
        [&name](const Entry& e) { return e.definition.name == name; });
    if (it != entries_.end()) {
        throw std::invalid_argument("Duplicate tool name: " + name);
    }
}

ToolRegistry::Builder& ToolRegistry::Builder::add(ToolDefinition def, ToolHandler handler) {
    check_name(def.name);
    if (!handler) {
        throw std::invalid_argument("Tool '" + def.name + "' has no handler");
    }
    entries_.push_back(Entry{std::move(def), std::move(handler), nullptr});
    return *this;
}

ToolRegistry::Builder& ToolRegistry::Builder::add_async(ToolDefinition def, AsyncToolHandler handler) {
    check_name(def.name);
    if (!handler) {
        throw std::invalid_argument("Tool '" + def.name + "' has no handler");
    }
    entries_.push_back(Entry{std::move(def), nullptr, std::move(handler)});
    return *this;
}

ToolRegistry ToolRegistry::Builder::build() {
    return ToolRegistry(std::move(entries_));
}

// ----------- ToolRegistry -----------

ToolRegistry::ToolRegistry(std::vector<Entry> entries)
    : entries_(std::move(entries)) {
    definitions_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].definition.name, i);
        definitions_.push_back(entries_[i].definition);
        list_json_.push_back(entries_[i].definition);
    }
}

const ToolRegistry::Entry* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

} // namespace toolhost
