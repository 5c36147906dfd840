#ifndef PARABOX_CORE_CONFIG_HPP
#define PARABOX_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstddef>
#include <cstdint>

namespace parabox {

class Config {
public:
    Config();

    // Load from JSON file
    bool load_file(const std::string& path);

    // Load from JSON string
    bool load_string(const std::string& json_str);

    // Keys use dot notation for nested sections (e.g. "catalog.base_url")
    std::string get_string(const std::string& key, const std::string& def = "") const;

    // String value, then the environment variable, then the default
    std::string get_string_or_env(const std::string& key,
                                  const char* env_name,
                                  const std::string& def = "") const;

    int64_t get_int(const std::string& key, int64_t def = 0) const;

    // Count or byte size. Negative values and values below min_value are
    // logged and replaced by def.
    size_t get_size(const std::string& key, size_t def, size_t min_value = 0) const;

    bool get_bool(const std::string& key, bool def = false) const;

private:
    Json data_;

    const Json* lookup(const std::string& key) const;
};

} // namespace parabox

#endif // PARABOX_CORE_CONFIG_HPP
