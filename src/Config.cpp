#include "ovini/Config.hpp"

#include <utility>

namespace ovini {

// ---- Entry -----------------------------------------------------------------

const Value& Entry::value() const {
    if (!node_) {
        throw KeyError(path_);
    }
    return *node_;
}

Entry Entry::get(const std::string& key) const {
    std::string child_path = path_.empty() ? key : path_ + "." + key;
    if (!is_group()) {
        return Entry(nullptr, std::move(child_path));
    }
    auto it = node_->find(key);
    if (it == node_->end()) {
        return Entry(nullptr, std::move(child_path));
    }
    return Entry(&*it, std::move(child_path));
}

// ---- Config ----------------------------------------------------------------

Config::Config(Value data) : data_(std::move(data)) {
    if (!data_.is_object()) {
        throw ConfigError("Config root must be an object, got " + type_name(data_));
    }
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        if (!it.value().is_object()) {
            throw ConfigError("Group '" + it.key() + "' must be an object, got " +
                              type_name(it.value()));
        }
    }
}

Entry Config::group(const std::string& name) const {
    return Entry(&data_, "").get(name);
}

Entry Config::get(const std::string& group_name, const std::string& setting) const {
    return group(group_name).get(setting);
}

bool Config::has_group(const std::string& name) const {
    return data_.contains(name);
}

bool Config::contains(const std::string& group_name, const std::string& setting) const {
    return get(group_name, setting).has_value();
}

std::vector<std::string> Config::group_names() const {
    std::vector<std::string> names;
    names.reserve(data_.size());
    for (auto it = data_.begin(); it != data_.end(); ++it) {
        names.push_back(it.key());
    }
    return names;
}

bool Config::add_group(const std::string& name) {
    if (has_group(name)) {
        return false;
    }
    data_[name] = Value::object();
    return true;
}

void Config::set(const std::string& group_name, const std::string& setting, Value value) {
    auto it = data_.find(group_name);
    if (it == data_.end()) {
        throw KeyError(group_name);
    }
    (*it)[setting] = std::move(value);
}

} // namespace ovini
