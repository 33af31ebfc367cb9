#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace toolhost {

// ---------- Content ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

// ---------- Input schema ----------

enum class PropertyType {
    String, Number, Integer, Boolean, Object, Array
};

std::string property_type_to_string(PropertyType type);
PropertyType property_type_from_string(const std::string& s);

struct PropertySchema {
    std::string name;
    PropertyType type = PropertyType::String;
    std::optional<std::string> description;
    std::vector<nlohmann::json> enum_values;   // empty = unconstrained
    std::optional<nlohmann::json> default_value;
    bool required = false;

    bool operator==(const PropertySchema& o) const {
        return name == o.name && type == o.type && description == o.description
               && enum_values == o.enum_values && default_value == o.default_value
               && required == o.required;
    }
};

/// Always an "object" schema; properties keep their declaration order.
struct InputSchema {
    std::vector<PropertySchema> properties;

    [[nodiscard]] const PropertySchema* find(const std::string& name) const;

    bool operator==(const InputSchema& o) const { return properties == o.properties; }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    InputSchema input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    static CallToolResult text(std::string text);
    static CallToolResult error(const std::string& message);

    /// value pretty-printed with a two-space indent, cut to max_bytes
    /// (see truncate_utf8).
    static CallToolResult pretty(const nlohmann::json& value,
                                 size_t max_bytes = std::string::npos);

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

/// Cut text to at most max_bytes without splitting a UTF-8 sequence,
/// appending "..." when anything was dropped.
[[nodiscard]] std::string truncate_utf8(const std::string& text, size_t max_bytes);

// ---------- Initialization ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, PropertyType t);
void from_json(const nlohmann::json& j, PropertyType& t);

void to_json(nlohmann::json& j, const InputSchema& s);
void from_json(const nlohmann::json& j, InputSchema& s);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace toolhost
