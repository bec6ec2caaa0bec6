/**
 * @file Errors.hpp
 * @brief Exception types for ovini configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - ParseError: A line of the input could not be accepted
 *   - DuplicateGroupError: Same group opened twice
 *   - MissingGroupError: Setting before any group header
 *   - InvalidLineError: Line matches no known shape
 * - FileNotFoundError: Config file missing or unreadable
 * - KeyError: Value requested from an absent lookup
 *
 * Every parse error is fatal: the parse stops at the first one and no
 * partial tree is returned.
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_ERRORS_HPP
#define OVINI_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace ovini {

/**
 * @brief Base class for all ovini exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A line of the configuration source was rejected
 *
 * Carries the source identity (file path or stream name) and the 1-based
 * line number of the offending line.
 */
class ParseError : public ConfigError {
public:
    /**
     * @brief Construct with location and error details
     * @param file Path or name of the source being parsed
     * @param line 1-based line number
     * @param details What was wrong with the line
     */
    ParseError(std::string file, std::size_t line, std::string details)
        : ConfigError("Parse error in '" + file + "' at line " +
                      std::to_string(line) + ": " + details)
        , file_(std::move(file))
        , line_(line)
        , details_(std::move(details))
    {}

    /**
     * @brief Get the path or name of the source
     */
    const std::string& file() const noexcept {
        return file_;
    }

    /**
     * @brief Get the 1-based line number
     */
    std::size_t line() const noexcept {
        return line_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::size_t line_;
    std::string details_;
};

/**
 * @brief A group header names a group that was already opened
 */
class DuplicateGroupError : public ParseError {
public:
    /**
     * @param group The group name seen twice
     * @param file Path or name of the source
     * @param line Line of the second header
     */
    DuplicateGroupError(std::string group, std::string file, std::size_t line)
        : ParseError(std::move(file), line, "duplicate group '" + group + "'")
        , group_(std::move(group))
    {}

    /**
     * @brief Get the duplicated group name
     */
    const std::string& group() const noexcept {
        return group_;
    }

private:
    std::string group_;
};

/**
 * @brief A setting appeared before the first group header
 */
class MissingGroupError : public ParseError {
public:
    MissingGroupError(std::string file, std::size_t line)
        : ParseError(std::move(file), line, "setting found before any group")
    {}
};

/**
 * @brief A non-blank line is neither a group header nor a setting
 */
class InvalidLineError : public ParseError {
public:
    InvalidLineError(std::string file, std::size_t line)
        : ParseError(std::move(file), line, "unable to parse line")
    {}
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Value requested from a lookup that found nothing
 */
class KeyError : public ConfigError {
public:
    /**
     * @param path Dotted path of the lookup (e.g., "ftp.path")
     */
    explicit KeyError(std::string path)
        : ConfigError("Key not found: '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the dotted path that was looked up
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace ovini

#endif // OVINI_ERRORS_HPP
