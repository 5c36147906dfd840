/*
 * parabox - Persistent plugin state
 *
 * {enabled, installed} as JSON in one file. Reads never fail: a missing or
 * corrupt file yields the default state. Writes replace the file atomically.
 */
#ifndef PARABOX_PLUGIN_STATE_STORE_HPP
#define PARABOX_PLUGIN_STATE_STORE_HPP

#include "types.hpp"
#include <string>

namespace parabox {

class StateStore {
public:
    explicit StateStore(const std::string& path);

    PluginRuntimeState load() const;
    bool save(const PluginRuntimeState& state) const;

    const std::string& path() const { return path_; }

    static const char* const kFileName;

private:
    std::string path_;
};

} // namespace parabox

#endif // PARABOX_PLUGIN_STATE_STORE_HPP
