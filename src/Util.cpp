#include "ovini/Util.hpp"
#include <algorithm>
#include <cctype>

namespace ovini {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(kWhitespace);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, char delim) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += delim;
        out += parts[i];
    }
    return out;
}

} // namespace ovini
