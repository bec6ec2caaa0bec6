/**
 * @file Line.cpp
 * @brief Implementation of line classification
 *
 * The shapes are matched by linear scans that reproduce the captures of
 * the greedy patterns
 * - group:    ^\[(.+)\]$
 * - setting:  ^(.+)\s?=\s?(.+)$
 * - override: ^(.+)<(.+)>\s?=\s?(.+)$
 * without backtracking, so a line of any length is handled in constant
 * stack space.
 *
 * @copyright (c) 2026. MIT License.
 */

#include "ovini/Line.hpp"
#include "ovini/Util.hpp"

#include <cctype>

namespace ovini {

namespace {
    constexpr auto npos = std::string::npos;

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // '.' in the patterns does not match line terminators, so a line that
    // holds one matches no shape at all.
    bool has_line_terminator(const std::string& line) {
        return line.find_first_of("\r\n") != npos;
    }

    /**
     * @brief Position of the '=' in `\s?=\s?(.+)$` starting at pos
     * @return Index of '=', or npos if the tail doesn't have that shape
     */
    std::size_t assignment_at(const std::string& line, std::size_t pos) {
        const std::size_t n = line.size();
        if (pos < n && line[pos] == '=' && pos + 1 < n) {
            return pos;
        }
        if (pos + 1 < n && is_space(line[pos]) && line[pos + 1] == '=' && pos + 2 < n) {
            return pos + 1;
        }
        return npos;
    }
}

std::string trim_comment(const std::string& line) {
    return trim(line.substr(0, line.find(';')));
}

bool is_empty_line(const std::string& line) {
    return line.find_first_not_of(kWhitespace) == std::string::npos;
}

std::optional<std::string> parse_group_name(const std::string& line) {
    if (line.size() < 3 || line.front() != '[' || line.back() != ']' ||
        has_line_terminator(line)) {
        return std::nullopt;
    }
    std::string name = trim(line.substr(1, line.size() - 2));
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::optional<SettingLine> parse_setting(const std::string& line) {
    const std::size_t n = line.size();
    if (n < 3 || has_line_terminator(line)) {
        return std::nullopt;
    }
    // Greedy key: the last '=' with at least one character before it and
    // one after it.
    std::size_t eq = line.find_last_of('=', n - 2);
    if (eq == npos || eq == 0) {
        return std::nullopt;
    }
    return SettingLine{trim(line.substr(0, eq)), trim(line.substr(eq + 1))};
}

std::optional<OverrideLine> parse_setting_override(const std::string& line) {
    const std::size_t n = line.size();
    if (n < 6 || has_line_terminator(line)) {
        return std::nullopt;
    }

    // Greedy name: the last '>' that is followed by an assignment.
    std::size_t close = npos;
    std::size_t eq = npos;
    for (std::size_t i = n; i-- > 0;) {
        if (line[i] == '>') {
            std::size_t at = assignment_at(line, i + 1);
            if (at != npos) {
                close = i;
                eq = at;
                break;
            }
        }
    }
    if (close == npos || close < 3) {
        return std::nullopt;
    }

    // Greedy key: the last '<' leaving a non-empty key and name.
    std::size_t open = line.find_last_of('<', close - 2);
    if (open == npos || open == 0) {
        return std::nullopt;
    }

    return OverrideLine{
        trim(line.substr(0, open)),
        trim(line.substr(open + 1, close - open - 1)),
        trim(line.substr(eq + 1))
    };
}

LineKind classify_line(const std::string& line) {
    if (is_empty_line(line)) return LineKind::Blank;
    if (parse_group_name(line)) return LineKind::Group;
    if (parse_setting(line)) return LineKind::Setting;
    return LineKind::Invalid;
}

const char* to_string(LineKind kind) noexcept {
    switch (kind) {
        case LineKind::Blank: return "blank";
        case LineKind::Group: return "group";
        case LineKind::Setting: return "setting";
        case LineKind::Invalid: return "invalid";
    }
    return "unknown";
}

} // namespace ovini
