#include "toolhost/types.hpp"
#include <stdexcept>

namespace toolhost {

// ---------- PropertyType ----------

std::string property_type_to_string(PropertyType type) {
    switch (type) {
        case PropertyType::String:  return "string";
        case PropertyType::Number:  return "number";
        case PropertyType::Integer: return "integer";
        case PropertyType::Boolean: return "boolean";
        case PropertyType::Object:  return "object";
        case PropertyType::Array:   return "array";
    }
    return "string";
}

PropertyType property_type_from_string(const std::string& s) {
    if (s == "string")  return PropertyType::String;
    if (s == "number")  return PropertyType::Number;
    if (s == "integer") return PropertyType::Integer;
    if (s == "boolean") return PropertyType::Boolean;
    if (s == "object")  return PropertyType::Object;
    if (s == "array")   return PropertyType::Array;
    throw std::invalid_argument("Unknown property type: " + s);
}

void to_json(nlohmann::json& j, PropertyType t) {
    j = property_type_to_string(t);
}

void from_json(const nlohmann::json& j, PropertyType& t) {
    t = property_type_from_string(j.get<std::string>());
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    if (j.value("type", std::string("text")) != "text") {
        throw std::invalid_argument("Unsupported content type: " + j.at("type").get<std::string>());
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- InputSchema ----------

const PropertySchema* InputSchema::find(const std::string& name) const {
    for (const auto& p : properties) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const InputSchema& s) {
    nlohmann::json props = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : s.properties) {
        nlohmann::json pj = {{"type", p.type}};
        if (p.description) pj["description"] = *p.description;
        if (!p.enum_values.empty()) pj["enum"] = p.enum_values;
        if (p.default_value) pj["default"] = *p.default_value;
        props[p.name] = std::move(pj);
        if (p.required) required.push_back(p.name);
    }
    j = {{"type", "object"}, {"properties", std::move(props)}};
    if (!required.empty()) j["required"] = std::move(required);
}

void from_json(const nlohmann::json& j, InputSchema& s) {
    s.properties.clear();
    std::vector<std::string> required;
    if (j.contains("required")) required = j.at("required").get<std::vector<std::string>>();

    if (j.contains("properties")) {
        for (const auto& [name, pj] : j.at("properties").items()) {
            PropertySchema p;
            p.name = name;
            p.type = pj.at("type").get<PropertyType>();
            if (pj.contains("description")) p.description = pj.at("description").get<std::string>();
            if (pj.contains("enum")) p.enum_values = pj.at("enum").get<std::vector<nlohmann::json>>();
            if (pj.contains("default")) p.default_value = pj.at("default");
            for (const auto& r : required) {
                if (r == name) p.required = true;
            }
            s.properties.push_back(std::move(p));
        }
    }
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    t.input_schema = j.at("inputSchema").get<InputSchema>();
}

// ---------- CallToolResult ----------

CallToolResult CallToolResult::text(std::string text) {
    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    return result;
}

CallToolResult CallToolResult::error(const std::string& message) {
    CallToolResult result;
    result.content.push_back(TextContent{"Error: " + message});
    result.is_error = true;
    return result;
}

CallToolResult CallToolResult::pretty(const nlohmann::json& value, size_t max_bytes) {
    return text(truncate_utf8(
        value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace), max_bytes));
}

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    // Back up over continuation bytes (10xxxxxx).
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = t.content;
    j["isError"] = t.is_error;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content = j.at("content").get<std::vector<TextContent>>();
    t.is_error = j.value("isError", false);
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
}

// ---------- InitializeResult ----------

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", t.server_info}
    };
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.server_info = j.at("serverInfo").get<Implementation>();
}

} // namespace toolhost
