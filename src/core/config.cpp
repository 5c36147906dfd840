#include <parabox/core/config.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

#include <fstream>
#include <cstdlib>

namespace parabox {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) return false;

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    Json parsed;
    if (!parse_json(json_str, parsed) || !parsed.is_object()) {
        return false;
    }
    data_ = parsed;
    return true;
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->has(parts[i])) return nullptr;
        node = &(*node)[parts[i]];
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = lookup(key);
    if (v && v->is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->as_string();
    }
    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

std::string Config::get_string_or_env(const std::string& key,
                                      const char* env_name,
                                      const std::string& def) const {
    std::string value = get_string(key, "");
    if (!value.empty()) return value;

    const char* env = env_name ? std::getenv(env_name) : nullptr;
    if (env && env[0]) {
        LOG_DEBUG("Config: using environment variable %s for '%s'", env_name, key.c_str());
        return std::string(env);
    }
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = lookup(key);
    if (v && v->is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->as_int(def);
    }
    return def;
}

size_t Config::get_size(const std::string& key, size_t def, size_t min_value) const {
    const Json* v = lookup(key);
    if (!v || !v->is_number()) return def;

    int64_t value = v->as_int(0);
    if (value < 0 || static_cast<uint64_t>(value) < min_value) {
        LOG_WARN("Config: '%s' = %lld is out of range, using %zu", key.c_str(),
                 static_cast<long long>(value), def);
        return def;
    }
    LOG_DEBUG("Config: found key '%s'", key.c_str());
    return static_cast<size_t>(value);
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = lookup(key);
    if (v && v->is_bool()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->as_bool(def);
    }
    return def;
}

} // namespace parabox
