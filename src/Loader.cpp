/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * @copyright (c) 2026. MIT License.
 */

#include "ovini/Loader.hpp"
#include "ovini/Errors.hpp"
#include "ovini/Util.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ovini {

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

} // anonymous namespace

OverrideSet make_override_set(const std::vector<std::string>& names) {
    OverrideSet out;
    for (const auto& name : names) {
        std::string trimmed = trim(name);
        if (!trimmed.empty()) {
            out.insert(std::move(trimmed));
        }
    }
    return out;
}

Config load_config_with(const std::string& path, const OverrideSet& enabled) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path);
    if (!file) {
        throw FileNotFoundError(path);
    }

    return parse_stream(file, enabled, path);
}

Config load_config(const std::string& path, const std::vector<std::string>& overrides) {
    return load_config_with(path, make_override_set(overrides));
}

} // namespace ovini
