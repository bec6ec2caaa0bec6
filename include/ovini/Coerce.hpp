/**
 * @file Coerce.hpp
 * @brief String-to-Value coercion for setting values
 *
 * Converts the raw text on the right-hand side of a setting into a typed
 * Value. Stages run in a fixed order and the first match wins:
 * - C1: Quoted string ('...' or "...", inner text kept verbatim)
 * - C2: Number (digits with at most one '.', integer before float)
 * - C3: Boolean (yes/no/true/false/1/0, case-insensitive)
 * - C4: List (comma separated, each element coerced again)
 * - C5: Raw string (fallback)
 *
 * Because C2 runs before C3, "1" and "0" become integers, never booleans.
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_COERCE_HPP
#define OVINI_COERCE_HPP

#include "ovini/Value.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ovini {

/**
 * @brief Coerce a raw setting value to the appropriate type
 *
 * Total: every input yields a Value. Input is expected to be trimmed
 * already; list elements are trimmed before they are coerced.
 *
 * @param raw Input string to coerce
 * @return Coerced Value
 *
 * Examples:
 * ```cpp
 * coerce_value("'hello, world'")  // → "hello, world" (string)
 * coerce_value("26214400")        // → 26214400 (integer)
 * coerce_value("3.5")             // → 3.5 (float)
 * coerce_value("NO")              // → false (boolean)
 * coerce_value("1")               // → 1 (integer, not boolean)
 * coerce_value("1.0, 2, yes")     // → [1.0, 2, true] (list)
 * coerce_value("/srv/var/tmp/")   // → "/srv/var/tmp/" (string)
 * ```
 */
Value coerce_value(const std::string& raw);

// ============================================================================
// Coercion stages
// ============================================================================

/**
 * @brief C1: Strip a matching pair of surrounding quotes
 *
 * @return Inner text (no escape processing, no trimming) when the first
 *         and last characters are the same quote character, nullopt otherwise
 */
std::optional<std::string> get_quoted_string(const std::string& s);

/**
 * @brief C2 gate: only ASCII digits and at most one '.'
 *
 * At least one digit is required, so "." and "" are not numbers.
 * Signs and exponents are not accepted.
 */
bool is_number(const std::string& s);

/**
 * @brief Parse a whole string as a signed 64-bit integer
 * @return Integer, or nullopt if s is not an integer or is out of range
 */
std::optional<std::int64_t> get_int(const std::string& s);

/**
 * @brief Parse a whole string as a double
 *
 * Accepts an optional sign, a decimal point and an exponent ("1", "1.",
 * ".5", "-2.5e3"). Rejects "inf", "nan", hex floats and trailing text.
 * Out-of-range input is still a float: underflow rounds to zero or a
 * subnormal, overflow gives infinity.
 */
std::optional<double> get_float(const std::string& s);

/**
 * @brief C3: Look s up in the boolean vocabulary (case-insensitive)
 */
std::optional<bool> get_boolean(const std::string& s);

/**
 * @brief C4: Coerce a comma separated list
 * @return Array of coerced elements when s holds at least one ',',
 *         nullopt otherwise
 */
std::optional<Value> get_list(const std::string& s);

} // namespace ovini

#endif // OVINI_COERCE_HPP
