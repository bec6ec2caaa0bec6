/**
 * @file Coerce.cpp
 * @brief Implementation of value coercion
 *
 * @copyright (c) 2026. MIT License.
 */

#include "ovini/Coerce.hpp"
#include "ovini/Util.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace ovini {

namespace {
    const std::unordered_map<std::string, bool>& boolean_vocabulary() {
        static const std::unordered_map<std::string, bool> table = {
            {"yes", true},   {"no", false},
            {"true", true},  {"false", false},
            {"1", true},     {"0", false},
        };
        return table;
    }

    bool is_digit(char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    /**
     * @brief Advance pos over a run of digits
     * @return Number of digits skipped
     */
    size_t skip_digits(const std::string& s, size_t& pos) {
        size_t start = pos;
        while (pos < s.size() && is_digit(s[pos])) ++pos;
        return pos - start;
    }

    void skip_sign(const std::string& s, size_t& pos) {
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
    }

    // [+-]?[0-9]+
    bool looks_like_integer(const std::string& s) {
        size_t pos = 0;
        skip_sign(s, pos);
        return skip_digits(s, pos) > 0 && pos == s.size();
    }

    // [+-]?([0-9]+\.?[0-9]*|\.[0-9]+)([eE][+-]?[0-9]+)?
    bool looks_like_float(const std::string& s) {
        size_t pos = 0;
        skip_sign(s, pos);
        size_t digits = skip_digits(s, pos);
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            digits += skip_digits(s, pos);
        }
        if (digits == 0) {
            return false;
        }
        if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
            ++pos;
            skip_sign(s, pos);
            if (skip_digits(s, pos) == 0) {
                return false;
            }
        }
        return pos == s.size();
    }
}

std::optional<std::string> get_quoted_string(const std::string& s) {
    if (s.size() < 2) {
        return std::nullopt;
    }
    const char first = s.front();
    if ((first == '"' || first == '\'') && s.back() == first) {
        return s.substr(1, s.size() - 2);
    }
    return std::nullopt;
}

bool is_number(const std::string& s) {
    bool seen_digit = false;
    bool seen_dot = false;
    for (unsigned char c : s) {
        if (std::isdigit(c)) {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            return false;
        }
    }
    return seen_digit;
}

std::optional<std::int64_t> get_int(const std::string& s) {
    if (!looks_like_integer(s)) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        long long val = std::stoll(s, &pos);
        if (pos == s.size()) {
            return static_cast<std::int64_t>(val);
        }
    } catch (const std::out_of_range&) {
        // Too large for int64; caller falls back to float
    }
    return std::nullopt;
}

std::optional<double> get_float(const std::string& s) {
    if (!looks_like_float(s)) {
        return std::nullopt;
    }
    // strtod rather than stod: on ERANGE it still yields the rounded
    // result (0 or a subnormal on underflow, HUGE_VAL on overflow).
    const char* begin = s.c_str();
    char* end = nullptr;
    double val = std::strtod(begin, &end);
    if (end != begin + s.size()) {
        return std::nullopt;
    }
    return val;
}

std::optional<bool> get_boolean(const std::string& s) {
    const auto& table = boolean_vocabulary();
    auto it = table.find(to_lower(s));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Value> get_list(const std::string& s) {
    auto parts = split(s, ',');
    if (parts.size() < 2) {
        return std::nullopt;
    }
    Value list = Value::array();
    for (const auto& part : parts) {
        list.push_back(coerce_value(trim(part)));
    }
    return list;
}

Value coerce_value(const std::string& raw) {
    // C1: Quoted string
    if (auto quoted = get_quoted_string(raw)) {
        return *quoted;
    }

    // C2: Number, integer first
    if (is_number(raw)) {
        if (auto i = get_int(raw)) {
            return *i;
        }
        if (auto f = get_float(raw)) {
            return *f;
        }
    }

    // C3: Boolean
    if (auto b = get_boolean(raw)) {
        return *b;
    }

    // C4: List
    if (auto list = get_list(raw)) {
        return std::move(*list);
    }

    // C5: Raw string
    return raw;
}

} // namespace ovini
