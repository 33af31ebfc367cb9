#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>

namespace toolhost {

/// True if value is an instance of the given JSON schema type.
/// Integral floats (e.g. 3.0) count as integers.
[[nodiscard]] bool matches_type(const nlohmann::json& value, PropertyType type);

/// Check tool arguments against the declared schema and return them with
/// defaults applied for missing optional properties.
///
/// null is treated as an empty object. Undeclared properties are passed
/// through. Throws ToolError naming the first violated property.
[[nodiscard]] nlohmann::json validate_arguments(const InputSchema& schema,
                                                const nlohmann::json& arguments);

} // namespace toolhost
