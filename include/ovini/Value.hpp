/**
 * @file Value.hpp
 * @brief Value type for coerced settings
 *
 * Uses nlohmann::ordered_json as the underlying value model. A coerced
 * setting is one of:
 * - Integer (int64_t)
 * - Float (double)
 * - Bool (true | false)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...]), each element coerced on its own
 *
 * Groups and the whole tree are objects. The ordered flavour keeps keys
 * in the order they were first written, so iteration follows the file.
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_VALUE_HPP
#define OVINI_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace ovini {

/**
 * @brief JSON-like value type for settings, groups and the tree
 *
 * Supports:
 * - Type queries: is_boolean(), is_number_integer(), is_number_float(),
 *   is_string(), is_array(), is_object()
 * - Type conversion: get<T>()
 * - Container operations: size(), empty(), find(), contains()
 * - Comparison: ==, !=
 *
 * See nlohmann::json documentation for complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("boolean", "integer", "float", "string",
 *         "list", "group", "null")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "list";
    if (val.is_object()) return "group";
    return "unknown";
}

/**
 * @brief Render a Value as indented JSON text for display
 *
 * Settings are stored byte for byte, so a file in a legacy encoding can
 * yield strings that are not valid UTF-8. Such bytes are replaced with
 * U+FFFD instead of making the dump throw.
 *
 * @param val The value to render
 * @param indent Spaces per nesting level
 */
inline std::string to_display_string(const Value& val, int indent = 2) {
    return val.dump(indent, ' ', false, Value::error_handler_t::replace);
}

} // namespace ovini

#endif // OVINI_VALUE_HPP
