/**
 * @file Line.hpp
 * @brief Line classification for the configuration format
 *
 * Recognized shapes, tried in this order on a comment-stripped line:
 * - L1: Blank (empty or whitespace only)
 * - L2: Group header      `[name]`
 * - L3: Setting           `key = value`
 * - L3o: Overridden setting `key<override> = value` (a refinement of L3)
 * - L4: Anything else is invalid
 *
 * Every function is a pure linear scan over the line with no shared
 * state, so they are safe to call from several threads and on lines of
 * any length.
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_LINE_HPP
#define OVINI_LINE_HPP

#include <optional>
#include <string>

namespace ovini {

/**
 * @brief Result of matching `key = value`
 *
 * Both fields are trimmed. The value is the raw text, not yet coerced.
 */
struct SettingLine {
    std::string key;
    std::string value;
};

/**
 * @brief Result of matching `key<override> = value`
 */
struct OverrideLine {
    std::string key;
    std::string override_name;
    std::string value;
};

/**
 * @brief Shape of a comment-stripped line
 */
enum class LineKind {
    Blank,
    Group,
    Setting,
    Invalid
};

/**
 * @brief Remove a ';' comment and surrounding whitespace
 *
 * Everything from the first ';' to the end of the line is dropped,
 * including a ';' inside a quoted value.
 *
 * Examples:
 * - "path = /tmp/; comment" → "path = /tmp/"
 * - "   ;; comment line"    → ""
 */
std::string trim_comment(const std::string& line);

/**
 * @brief True if line is empty or whitespace only
 */
bool is_empty_line(const std::string& line);

/**
 * @brief L2: Extract the group name from `[name]`
 *
 * The inner text is captured greedily and trimmed; "[a]b]" names "a]b".
 *
 * @return Trimmed name, or nullopt if the line is not a header or the
 *         name is empty ("[]", "[  ]")
 */
std::optional<std::string> parse_group_name(const std::string& line);

/**
 * @brief L3: Split `key = value`
 *
 * At most one space is absorbed on each side of '='. The key capture is
 * greedy, so "path<staging> = /srv/" yields key "path<staging>" and a line
 * holding several '=' is split at the last one that leaves a value.
 */
std::optional<SettingLine> parse_setting(const std::string& line);

/**
 * @brief L3o: Split `key<override> = value`
 */
std::optional<OverrideLine> parse_setting_override(const std::string& line);

/**
 * @brief Classify an already comment-stripped line
 */
LineKind classify_line(const std::string& line);

/**
 * @brief Name of a LineKind ("blank", "group", "setting", "invalid")
 */
const char* to_string(LineKind kind) noexcept;

} // namespace ovini

#endif // OVINI_LINE_HPP
