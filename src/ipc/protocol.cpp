#include <parabox/ipc/protocol.hpp>

namespace parabox {
namespace protocol {

std::string message_type(const Json& msg) {
    return msg.get_string("type");
}

bool is_permissions_value(const Json& permissions) {
    return permissions.is_object() || permissions.is_array();
}

Json make_load(const std::string& plugin_id, const std::string& version,
               const std::string& entry_path, const Json& permissions) {
    Json msg = Json::object();
    msg.set("type", kLoad);
    msg.set("pluginId", plugin_id);
    msg.set("version", version);
    msg.set("entryPath", entry_path);
    msg.set("permissions", permissions);
    return msg;
}

Json make_menu_click(const std::string& plugin_id, const std::string& id,
                     const std::string& request_id) {
    Json msg = Json::object();
    msg.set("type", kMenuClick);
    msg.set("pluginId", plugin_id);
    msg.set("id", id);
    msg.set("requestId", request_id);
    return msg;
}

Json make_shutdown() {
    Json msg = Json::object();
    msg.set("type", kShutdown);
    return msg;
}

Json make_ready() {
    Json msg = Json::object();
    msg.set("type", kReady);
    return msg;
}

Json make_error(const std::string& message) {
    Json msg = Json::object();
    msg.set("type", kError);
    msg.set("message", message);
    return msg;
}

Json make_menu_add(const std::string& plugin_id, const std::string& id,
                   const std::string& label) {
    Json item = Json::object();
    item.set("id", id);
    item.set("label", label);

    Json msg = Json::object();
    msg.set("type", kMenuAdd);
    msg.set("pluginId", plugin_id);
    msg.set("item", item);
    return msg;
}

Json make_output(const char* type, const std::string& plugin_id, const std::string& text) {
    Json msg = Json::object();
    msg.set("type", type);
    msg.set("pluginId", plugin_id);
    msg.set("text", text);
    return msg;
}

Json make_click_result(const std::string& request_id, bool ok, const std::string& error) {
    Json msg = Json::object();
    msg.set("type", kMenuClickResult);
    msg.set("requestId", request_id);
    msg.set("ok", ok);
    if (!ok && !error.empty()) {
        msg.set("error", error);
    }
    return msg;
}

} // namespace protocol
} // namespace parabox
