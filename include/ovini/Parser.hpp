/**
 * @file Parser.hpp
 * @brief Streaming parser for grouped settings with overrides
 *
 * The parser consumes one line at a time and keeps only the state it needs
 * (current group, line number, tree built so far), so input of any size can
 * be streamed through it.
 *
 * Per line, in order:
 * - P1: Strip the ';' comment and surrounding whitespace
 * - P2: Skip the line if nothing is left
 * - P3: `[name]` opens a new group (DuplicateGroupError if seen before)
 * - P4: `key = value` stores a setting in the current group
 *       (MissingGroupError if no group is open yet)
 * - P5: `key<name> = value` stores `key` only when `name` is enabled; a
 *       disabled override is accepted and ignored
 * - P6: Anything else raises InvalidLineError
 *
 * An enabled override beats the plain setting of the same key in its group
 * regardless of which line comes first. Otherwise the later line wins.
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_PARSER_HPP
#define OVINI_PARSER_HPP

#include "ovini/Config.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ovini {

/// Names of the overrides enabled for one parse
using OverrideSet = std::set<std::string>;

/**
 * @brief Line-by-line parser state machine
 *
 * A Parser handles exactly one source. Errors are thrown from feed() at the
 * first bad line; the parser must not be used after that.
 */
class Parser {
public:
    /**
     * @param enabled Overrides to apply; copied, so the caller may reuse it
     * @param source_name File path or stream name used in error messages
     */
    explicit Parser(OverrideSet enabled = {}, std::string source_name = "<stream>");

    /**
     * @brief Consume the next line of the source
     * @param raw_line Line without its terminating newline
     * @throws DuplicateGroupError, MissingGroupError, InvalidLineError
     */
    void feed(const std::string& raw_line);

    /// Number of lines fed so far (the 1-based number of the last line)
    std::size_t line_number() const noexcept { return line_number_; }

    /// Group that settings currently go to, nullopt before the first header
    const std::optional<std::string>& current_group() const noexcept { return current_group_; }

    const OverrideSet& enabled_overrides() const noexcept { return enabled_; }
    const std::string& source_name() const noexcept { return source_name_; }

    /**
     * @brief Hand over the finished tree
     *
     * Leaves the parser with an empty tree.
     */
    Config finish();

private:
    void open_group(const std::string& name);
    void store_setting(const std::string& key, const std::string& raw_value);
    void store_override(const std::string& key, const std::string& raw_value);

    OverrideSet enabled_;
    std::string source_name_;
    std::size_t line_number_ = 0;
    std::optional<std::string> current_group_;
    // Keys of the current group already set by an enabled override
    std::set<std::string> overridden_;
    Config config_;
};

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Parse everything readable from a stream
 *
 * @param in Source; read with std::getline in a single forward pass
 * @param enabled Overrides to apply
 * @param source_name Name reported in errors
 * @return Completed tree
 * @throws ParseError subclasses on the first rejected line
 */
Config parse_stream(std::istream& in, const OverrideSet& enabled = {},
                    const std::string& source_name = "<stream>");

/**
 * @brief Parse configuration text held in memory
 */
Config parse_string(const std::string& text, const OverrideSet& enabled = {},
                    const std::string& source_name = "<string>");

/**
 * @brief Parse a sequence of lines (without newlines)
 */
Config parse_lines(const std::vector<std::string>& lines, const OverrideSet& enabled = {},
                   const std::string& source_name = "<lines>");

} // namespace ovini

#endif // OVINI_PARSER_HPP
