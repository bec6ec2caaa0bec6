#ifndef OVINI_UTIL_HPP
#define OVINI_UTIL_HPP

#include <string>
#include <vector>

namespace ovini {

// Characters stripped by trim().
inline constexpr const char* kWhitespace = " \t\r\n\f\v";

// Remove leading and trailing whitespace.
std::string trim(const std::string& s);

// ASCII lowercase copy.
std::string to_lower(std::string s);

// Split on every occurrence of delim. Empty segments are kept, so
// "a,,b" -> {"a", "", "b"} and "a," -> {"a", ""}.
std::vector<std::string> split(const std::string& s, char delim);

// Join segments with delim ("ftp" + "path" -> "ftp.path").
std::string join(const std::vector<std::string>& parts, char delim);

} // namespace ovini

#endif // OVINI_UTIL_HPP
