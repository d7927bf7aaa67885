/*
 * scriptdeck C++ - Configuration Implementation
 */
#include <scriptdeck/core/config.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace scriptdeck {

Config::Config() : data_(Json::object()) {}

bool Config::load(const std::string& path, bool required) {
    std::ifstream in(path.c_str());
    if (!in) {
        if (required) {
            last_error_ = "Cannot open config file: " + path;
            LOG_ERROR("[Config] %s", last_error_.c_str());
            return false;
        }
        LOG_DEBUG("[Config] No config file at %s, using defaults", path.c_str());
        return true;
    }
    
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!load_string(ss.str())) {
        LOG_ERROR("[Config] Failed to parse %s: %s", path.c_str(), last_error_.c_str());
        return false;
    }
    
    source_path_ = path;
    LOG_INFO("[Config] Loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        return false;
    }
    
    if (!parsed.is_object()) {
        last_error_ = "top-level value must be an object";
        return false;
    }
    
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::find_or_create(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return default_val;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v) return default_val;
    if (v->is_number_integer()) return v->get<int64_t>();
    if (v->is_number_float()) return static_cast<int64_t>(v->get<double>());
    return default_val;
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return default_val;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return default_val;
    return v->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* v = find(key);
    if (!v || !v->is_array()) return out;
    for (Json::const_iterator it = v->begin(); it != v->end(); ++it) {
        if (it->is_string()) out.push_back(it->get<std::string>());
    }
    return out;
}

void Config::set_string(const std::string& key, const std::string& value) {
    find_or_create(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    find_or_create(key) = value;
}

} // namespace scriptdeck
