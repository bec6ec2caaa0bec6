/**
 * @file Loader.hpp
 * @brief File loading
 *
 * Opens a configuration file and streams it through the Parser without
 * reading it into memory first.
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_LOADER_HPP
#define OVINI_LOADER_HPP

#include "ovini/Config.hpp"
#include "ovini/Parser.hpp"

#include <string>
#include <vector>

namespace ovini {

/**
 * @brief Load configuration from a file.
 *
 * @param path Path to the configuration file
 * @param overrides Override names to enable; order and repeats don't matter
 * @return Parsed Config
 * @throws FileNotFoundError if the file doesn't exist or can't be opened
 * @throws DuplicateGroupError, MissingGroupError, InvalidLineError on the
 *         first rejected line (error file() is the path)
 *
 * Example:
 * ```cpp
 * auto cfg = ovini::load_config("app.conf", {"production", "ubuntu"});
 * std::string path = cfg["ftp"]["path"].value_or<std::string>("/tmp/");
 * ```
 */
Config load_config(const std::string& path, const std::vector<std::string>& overrides = {});

/**
 * @brief Load configuration from a file with an already-built override set.
 */
Config load_config_with(const std::string& path, const OverrideSet& enabled);

/**
 * @brief Convert a list of override names into an OverrideSet.
 *
 * Entries are trimmed and empty entries dropped.
 */
OverrideSet make_override_set(const std::vector<std::string>& names);

} // namespace ovini

#endif // OVINI_LOADER_HPP
