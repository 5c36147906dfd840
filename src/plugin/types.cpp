#include <parabox/plugin/types.hpp>

namespace parabox {

bool is_valid_permissions(const Json& permissions) {
    return permissions.is_object() || permissions.is_array();
}

PluginCatalogEntry catalog_entry_from_json(const Json& obj) {
    PluginCatalogEntry entry;
    entry.id = obj.get_string("id");
    entry.version = obj.get_string("version");
    entry.name = obj.get_string("name");
    entry.sha256 = obj.get_string("sha256");
    if (obj.has("permissions")) {
        entry.permissions = obj["permissions"];
    }
    return entry;
}

Json to_json(const PluginCatalogEntry& entry) {
    Json obj = Json::object();
    obj.set("id", entry.id);
    obj.set("version", entry.version);
    obj.set("name", entry.name);
    obj.set("sha256", entry.sha256);
    obj.set("permissions", entry.permissions);
    return obj;
}

InstalledPluginRef installed_ref_from_entry(const PluginCatalogEntry& entry) {
    InstalledPluginRef ref;
    ref.id = entry.id;
    ref.version = entry.version;
    ref.name = entry.name;
    ref.sha256 = entry.sha256;
    ref.permissions = entry.permissions;
    return ref;
}

bool installed_ref_from_json(const Json& obj, InstalledPluginRef& out) {
    if (!obj.is_object()) return false;

    InstalledPluginRef ref;
    ref.id = obj.get_string("id");
    ref.version = obj.get_string("version");
    if (ref.id.empty() || ref.version.empty()) return false;

    ref.name = obj.get_string("name");
    ref.sha256 = obj.get_string("sha256");
    if (obj.has("permissions")) {
        ref.permissions = obj["permissions"];
    }
    out = ref;
    return true;
}

Json to_json(const InstalledPluginRef& ref) {
    Json obj = Json::object();
    obj.set("id", ref.id);
    obj.set("version", ref.version);
    if (!ref.name.empty()) obj.set("name", ref.name);
    if (!ref.sha256.empty()) obj.set("sha256", ref.sha256);
    obj.set("permissions", ref.permissions);
    return obj;
}

PluginRuntimeState runtime_state_from_json(const Json& obj) {
    PluginRuntimeState state;
    if (!obj.is_object()) return state;

    state.enabled = obj.get_bool("enabled", false);
    if (obj.has("installed")) {
        state.has_installed = installed_ref_from_json(obj["installed"], state.installed);
    }
    return state;
}

Json to_json(const PluginRuntimeState& state) {
    Json obj = Json::object();
    obj.set("enabled", state.enabled);
    obj.set("installed", state.has_installed ? to_json(state.installed) : Json());
    return obj;
}

Json to_json(const MenuItemDescriptor& item) {
    Json obj = Json::object();
    obj.set("pluginId", item.plugin_id);
    obj.set("id", item.id);
    obj.set("label", item.label);
    return obj;
}

Json to_json(const std::vector<MenuItemDescriptor>& items) {
    Json arr = Json::array();
    for (std::vector<MenuItemDescriptor>::const_iterator it = items.begin(); it != items.end(); ++it) {
        arr.push(to_json(*it));
    }
    return arr;
}

Json to_json(const PluginStatus& status) {
    Json obj = Json::object();
    obj.set("enabled", status.enabled);
    obj.set("installed", status.has_installed ? to_json(status.installed) : Json());
    obj.set("running", status.running);
    obj.set("menuItems", to_json(status.menu_items));
    obj.set("lastError", status.last_error.empty() ? Json() : Json(status.last_error));
    return obj;
}

Json to_json(const PluginOutputEvent& event) {
    Json obj = Json::object();
    obj.set("type", event.type);
    obj.set("pluginId", event.plugin_id);
    obj.set("text", event.text);
    return obj;
}

} // namespace parabox
