/*
 * scriptdeck C++ - Configuration
 *
 * JSON-backed configuration with dotted-key access:
 *   cfg.get_int("sandbox.default_timeout", 30)
 *
 * Loaded once at startup. Nothing in the sandbox path reads the
 * environment or reconfigures itself per request.
 */
#ifndef scriptdeck_CORE_CONFIG_HPP
#define scriptdeck_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace scriptdeck {

class Config {
public:
    Config();
    
    // Load from a JSON file. Missing file is not an error (defaults apply)
    // unless `required` is set.
    bool load(const std::string& path, bool required = false);
    
    // Load from a JSON string
    bool load_string(const std::string& text);
    
    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    double get_double(const std::string& key, double default_val = 0.0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key) const;
    
    bool has(const std::string& key) const;
    
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    
    const Json& raw() const { return data_; }
    const std::string& source_path() const { return source_path_; }
    std::string last_error() const { return last_error_; }
    
private:
    Json data_;
    std::string source_path_;
    std::string last_error_;
    
    const Json* find(const std::string& key) const;
    Json& find_or_create(const std::string& key);
};

} // namespace scriptdeck

#endif // scriptdeck_CORE_CONFIG_HPP
