/**
 * @file Parser.cpp
 * @brief Implementation of the streaming parser
 *
 * @copyright (c) 2026. MIT License.
 */

#include "ovini/Parser.hpp"
#include "ovini/Coerce.hpp"
#include "ovini/Errors.hpp"
#include "ovini/Line.hpp"

#include <istream>
#include <sstream>
#include <utility>

namespace ovini {

Parser::Parser(OverrideSet enabled, std::string source_name)
    : enabled_(std::move(enabled))
    , source_name_(std::move(source_name))
{}

void Parser::feed(const std::string& raw_line) {
    ++line_number_;

    // P1 + P2: comments and blank lines
    const std::string line = trim_comment(raw_line);
    if (is_empty_line(line)) {
        return;
    }

    // P3: group header
    if (auto name = parse_group_name(line)) {
        open_group(*name);
        return;
    }

    // P4: setting, possibly overridden
    if (auto setting = parse_setting(line)) {
        if (!current_group_) {
            throw MissingGroupError(source_name_, line_number_);
        }
        // The setting pattern keeps "key<name>" as the key; matching the
        // whole line again is what separates the base key from the name.
        auto overridden = parse_setting_override(line);
        if (!overridden) {
            store_setting(setting->key, setting->value);
        } else if (enabled_.count(overridden->override_name)) {
            store_override(overridden->key, overridden->value);
        }
        return;
    }

    // P6
    throw InvalidLineError(source_name_, line_number_);
}

Config Parser::finish() {
    current_group_.reset();
    overridden_.clear();
    return std::exchange(config_, Config());
}

void Parser::open_group(const std::string& name) {
    if (!config_.add_group(name)) {
        throw DuplicateGroupError(name, source_name_, line_number_);
    }
    current_group_ = name;
    overridden_.clear();
}

void Parser::store_setting(const std::string& key, const std::string& raw_value) {
    if (overridden_.count(key)) {
        return;
    }
    config_.set(*current_group_, key, coerce_value(raw_value));
}

void Parser::store_override(const std::string& key, const std::string& raw_value) {
    config_.set(*current_group_, key, coerce_value(raw_value));
    overridden_.insert(key);
}

// ============================================================================
// Entry points
// ============================================================================

Config parse_stream(std::istream& in, const OverrideSet& enabled,
                    const std::string& source_name) {
    Parser parser(enabled, source_name);
    std::string line;
    while (std::getline(in, line)) {
        parser.feed(line);
    }
    if (in.bad()) {
        throw ConfigError("Read error in '" + source_name + "' after line " +
                          std::to_string(parser.line_number()));
    }
    return parser.finish();
}

Config parse_string(const std::string& text, const OverrideSet& enabled,
                    const std::string& source_name) {
    std::istringstream in(text);
    return parse_stream(in, enabled, source_name);
}

Config parse_lines(const std::vector<std::string>& lines, const OverrideSet& enabled,
                   const std::string& source_name) {
    Parser parser(enabled, source_name);
    for (const auto& line : lines) {
        parser.feed(line);
    }
    return parser.finish();
}

} // namespace ovini
