#include "toolhost/schema.hpp"
#include "toolhost/error.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace toolhost {

bool matches_type(const nlohmann::json& value, PropertyType type) {
    switch (type) {
        case PropertyType::String:  return value.is_string();
        case PropertyType::Number:  return value.is_number();
        // Integers must fit int64_t so handlers can read them with get<int64_t>().
        case PropertyType::Integer:
            if (value.is_number_unsigned()) {
                return value.get<uint64_t>()
                       <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            }
            if (value.is_number_integer()) return true;
            if (value.is_number_float()) {
                double d = value.get<double>();
                return std::isfinite(d) && std::floor(d) == d
                       && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
            }
            return false;
        case PropertyType::Boolean: return value.is_boolean();
        case PropertyType::Object:  return value.is_object();
        case PropertyType::Array:   return value.is_array();
    }
    return false;
}

nlohmann::json validate_arguments(const InputSchema& schema, const nlohmann::json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw ToolError("Arguments must be an object");
    }
    nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;

    for (const auto& prop : schema.properties) {
        auto it = args.find(prop.name);
        if (it == args.end() || it->is_null()) {
            if (prop.required) {
                throw ToolError("Missing required argument: " + prop.name);
            }
            if (prop.default_value) {
                args[prop.name] = *prop.default_value;
            }
            continue;
        }

        if (!matches_type(*it, prop.type)) {
            throw ToolError("Invalid type for argument '" + prop.name + "': expected "
                            + property_type_to_string(prop.type));
        }

        if (!prop.enum_values.empty()
            && std::find(prop.enum_values.begin(), prop.enum_values.end(), *it)
                   == prop.enum_values.end()) {
            throw ToolError("Invalid value for argument '" + prop.name + "': expected one of "
                            + nlohmann::json(prop.enum_values).dump());
        }
    }
    return args;
}

} // namespace toolhost
