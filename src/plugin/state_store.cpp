#include <parabox/plugin/state_store.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

namespace parabox {

const char* const StateStore::kFileName = "plugins.state.json";

StateStore::StateStore(const std::string& path)
    : path_(path)
{}

PluginRuntimeState StateStore::load() const {
    std::string text;
    if (!read_file(path_, text)) {
        LOG_DEBUG("No plugin state at %s, using defaults", path_.c_str());
        return PluginRuntimeState();
    }

    Json obj;
    if (!parse_json(text, obj) || !obj.is_object()) {
        LOG_WARN("Plugin state file %s is corrupt, using defaults", path_.c_str());
        return PluginRuntimeState();
    }
    return runtime_state_from_json(obj);
}

bool StateStore::save(const PluginRuntimeState& state) const {
    std::string dir = dirname(path_);
    if (!dir.empty() && !mkdir_p(dir)) {
        LOG_ERROR("Cannot create state directory %s", dir.c_str());
        return false;
    }

    std::string text = to_json(state).dump() + "\n";
    if (!write_file_atomic(path_, text)) {
        LOG_ERROR("Cannot write plugin state to %s", path_.c_str());
        return false;
    }
    return true;
}

} // namespace parabox
