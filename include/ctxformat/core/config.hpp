/*
 * ctxformat C++ - Configuration
 *
 * JSON-backed configuration with dotted-path lookups:
 *
 *   {
 *     "log_level": "info",
 *     "writer": { "base_dir": ".ctx", "throw_on_secrets": false }
 *   }
 *
 *   cfg.get_string("writer.base_dir", ".")  ->  ".ctx"
 */
#ifndef ctxformat_CORE_CONFIG_HPP
#define ctxformat_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace ctxformat {

class Config {
public:
    Config();

    // Load from a JSON file. On failure the previous contents are kept.
    bool load_file(const std::string& path);

    // Load from a JSON string
    bool load_string(const std::string& text);

    bool has(const std::string& path) const;

    std::string get_string(const std::string& path, const std::string& default_val = "") const;
    int64_t get_int(const std::string& path, int64_t default_val = 0) const;
    bool get_bool(const std::string& path, bool default_val = false) const;

    // Creates intermediate objects as needed
    void set_string(const std::string& path, const std::string& value);
    void set_bool(const std::string& path, bool value);

    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    // Returns nullptr if any path component is missing
    const Json* find(const std::string& path) const;
    Json& find_or_create(const std::string& path);

    Json data_;
    std::string last_error_;
};

} // namespace ctxformat

#endif // ctxformat_CORE_CONFIG_HPP
