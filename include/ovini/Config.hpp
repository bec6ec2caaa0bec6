/**
 * @file Config.hpp
 * @brief Parsed configuration tree and absent-tolerant lookups
 *
 * A Config is a two-level tree: group name → setting name → coerced Value.
 * Lookups never fail on missing keys. They return an Entry, which is either
 * absent or refers to a node of the tree, and can be indexed again:
 *
 * ```cpp
 * Config cfg = load_config("app.conf", {"production"});
 * cfg["ftp"]["path"].value_or<std::string>("/tmp/");
 * cfg.group("ftp").get("path").as<std::string>();   // std::optional
 * cfg["nope"]["path"].has_value();                   // false, no throw
 * ```
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef OVINI_CONFIG_HPP
#define OVINI_CONFIG_HPP

#include "ovini/Errors.hpp"
#include "ovini/Value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ovini {

/**
 * @brief Result of a lookup: a node of the tree, or absent
 *
 * An Entry does not own its node. It stays valid as long as the Config it
 * came from is alive and unmodified.
 */
class Entry {
public:
    /// Absent entry
    Entry() = default;

    /**
     * @param node Node found by the lookup, or nullptr when absent
     * @param path Dotted path of the lookup, used in error messages
     */
    Entry(const Value* node, std::string path)
        : node_(node), path_(std::move(path)) {}

    bool has_value() const noexcept { return node_ != nullptr; }
    explicit operator bool() const noexcept { return has_value(); }

    /// True if this entry is a group (an object of settings)
    bool is_group() const noexcept { return node_ && node_->is_object(); }

    /// Dotted path that produced this entry ("ftp", "ftp.path")
    const std::string& path() const noexcept { return path_; }

    /**
     * @brief Access the node
     * @throws KeyError if the entry is absent
     */
    const Value& value() const;

    /**
     * @brief Look up a child by name
     *
     * Absent if this entry is absent, is not a group, or has no such child.
     */
    Entry get(const std::string& key) const;
    Entry operator[](const std::string& key) const { return get(key); }

    /**
     * @brief Typed access
     * @return Converted value, or nullopt if absent or not convertible
     */
    template <typename T>
    std::optional<T> as() const {
        if (!node_) return std::nullopt;
        try {
            return node_->get<T>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    template <typename T>
    T value_or(const T& fallback) const {
        auto v = as<T>();
        return v ? *v : fallback;
    }

    bool operator==(const Value& other) const {
        return node_ && *node_ == other;
    }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    const Value* node_ = nullptr;
    std::string path_;
};

/**
 * @brief Core configuration container
 *
 * Internally uses an ordered Value object so groups and settings iterate in
 * file order. Readers only need the const interface; add_group() and set()
 * are what the parser uses to build the tree.
 */
class Config {
public:
    Config() = default;

    /**
     * @brief Adopt an existing tree
     * @throws ConfigError unless data is an object whose members are objects
     */
    explicit Config(Value data);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }

    // Lookups (absent instead of throwing)
    Entry group(const std::string& name) const;
    Entry operator[](const std::string& name) const { return group(name); }
    Entry get(const std::string& group_name, const std::string& setting) const;

    template <typename T>
    T get(const std::string& group_name, const std::string& setting, const T& fallback) const {
        return get(group_name, setting).value_or(fallback);
    }

    bool has_group(const std::string& name) const;
    bool contains(const std::string& group_name, const std::string& setting) const;

    std::vector<std::string> group_names() const;
    std::size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    // Building
    /**
     * @brief Create an empty group
     * @return false if the group already exists (nothing is changed)
     */
    bool add_group(const std::string& name);

    /**
     * @brief Store a setting, replacing any previous value for the key
     * @throws KeyError if the group does not exist
     */
    void set(const std::string& group_name, const std::string& setting, Value value);

    bool operator==(const Config& other) const { return data_ == other.data_; }
    bool operator!=(const Config& other) const { return !(*this == other); }

private:
    Value data_ = Value::object();
};

} // namespace ovini

#endif // OVINI_CONFIG_HPP
