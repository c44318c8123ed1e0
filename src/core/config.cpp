#include <ctxformat/core/config.hpp>
#include <ctxformat/core/logger.hpp>
#include <ctxformat/core/utils.hpp>

#include <sstream>
#include <vector>

namespace ctxformat {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream iss(path);
    std::string part;
    while (std::getline(iss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::string text;
    std::string error;
    if (!read_file(path, text, error)) {
        last_error_ = error;
        LOG_ERROR("[Config] %s", error.c_str());
        return false;
    }
    if (!load_string(text)) {
        LOG_ERROR("[Config] Failed to parse '%s': %s", path.c_str(), last_error_.c_str());
        return false;
    }
    LOG_DEBUG("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            last_error_ = "top-level JSON value must be an object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        return false;
    }
}

const Json* Config::find(const std::string& path) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split_path(path);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::find_or_create(const std::string& path) {
    Json* node = &data_;
    std::vector<std::string> parts = split_path(path);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& path) const {
    return find(path) != nullptr;
}

std::string Config::get_string(const std::string& path, const std::string& default_val) const {
    const Json* v = find(path);
    if (!v) return default_val;
    if (v->is_string()) return v->get<std::string>();
    if (v->is_number() || v->is_boolean()) return v->dump();
    LOG_WARN("[Config] '%s' is not a string, using default", path.c_str());
    return default_val;
}

int64_t Config::get_int(const std::string& path, int64_t default_val) const {
    const Json* v = find(path);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_string()) {
        int64_t parsed = 0;
        if (parse_int64(v->get<std::string>(), parsed)) return parsed;
    }
    LOG_WARN("[Config] '%s' is not an integer, using default", path.c_str());
    return default_val;
}

bool Config::get_bool(const std::string& path, bool default_val) const {
    const Json* v = find(path);
    if (!v) return default_val;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_string()) {
        std::string s = to_lower(v->get<std::string>());
        if (s == "true" || s == "yes" || s == "1") return true;
        if (s == "false" || s == "no" || s == "0") return false;
    }
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    LOG_WARN("[Config] '%s' is not a boolean, using default", path.c_str());
    return default_val;
}

void Config::set_string(const std::string& path, const std::string& value) {
    find_or_create(path) = value;
}

void Config::set_bool(const std::string& path, bool value) {
    find_or_create(path) = value;
}

} // namespace ctxformat
