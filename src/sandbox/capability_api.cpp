#include <parabox/sandbox/capability_api.hpp>
#include <parabox/ipc/protocol.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

namespace parabox {

namespace {

// String argument at idx without coercion; NULL for any other type
const char* raw_string(lua_State* L, int idx, size_t* len) {
    *len = 0;
    if (lua_type(L, idx) != LUA_TSTRING) return NULL;
    return lua_tolstring(L, idx, len);
}

} // namespace

CapabilityApi::CapabilityApi(const std::string& plugin_id,
                             HandlerTable& handlers,
                             const EventSink& sink,
                             size_t max_menu_items)
    : plugin_id_(plugin_id)
    , handlers_(handlers)
    , sink_(sink)
    , max_menu_items_(max_menu_items)
    , menu_count_(0)
{}

bool CapabilityApi::install(LuaRuntime& runtime, std::string* error) {
    return runtime.protected_call(&CapabilityApi::install_globals, this, error);
}

void CapabilityApi::emit(const Json& msg) {
    if (sink_) sink_(msg);
}

void CapabilityApi::say(const std::string& text) {
    std::string clipped = clip_text(text, protocol::kSayMaxChars);
    if (clipped.empty()) return;
    emit(protocol::make_output(protocol::kSay, plugin_id_, clipped));
}

void CapabilityApi::suggestion(const std::string& text) {
    std::string clipped = clip_text(text, protocol::kSuggestionMaxChars);
    if (clipped.empty()) return;
    emit(protocol::make_output(protocol::kSuggestion, plugin_id_, clipped));
}

void CapabilityApi::add_menu_item(const std::string& id, const std::string& label) {
    if (menu_count_ >= max_menu_items_) return;

    std::string clipped_id = clip_text(id, protocol::kMenuIdMaxChars);
    std::string clipped_label = clip_text(label, protocol::kMenuLabelMaxChars);
    if (clipped_id.empty() || clipped_label.empty()) return;

    ++menu_count_;
    emit(protocol::make_menu_add(plugin_id_, clipped_id, clipped_label));
}

bool CapabilityApi::on_menu_click(const std::string& id, int ref) {
    std::string clipped_id = clip_text(id, protocol::kMenuIdMaxChars);
    if (clipped_id.empty()) return false;
    return handlers_.set(clipped_id, ref);
}

void CapabilityApi::emit_text(bool is_say, const char* s, size_t len) {
    try {
        std::string text = s ? std::string(s, len) : std::string();
        if (is_say) {
            say(text);
        } else {
            suggestion(text);
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("capability %s dropped: %s", is_say ? "say" : "suggestion", e.what());
    }
}

CapabilityApi* CapabilityApi::self(lua_State* L) {
    return static_cast<CapabilityApi*>(lua_touserdata(L, lua_upvalueindex(1)));
}

int CapabilityApi::l_say(lua_State* L) {
    size_t len = 0;
    const char* s = raw_string(L, 1, &len);
    self(L)->emit_text(true, s, len);
    return 0;
}

int CapabilityApi::l_suggestion(lua_State* L) {
    size_t len = 0;
    const char* s = raw_string(L, 1, &len);
    self(L)->emit_text(false, s, len);
    return 0;
}

int CapabilityApi::l_add_menu_item(lua_State* L) {
    if (lua_type(L, 1) != LUA_TTABLE) return 0;

    lua_settop(L, 1);
    lua_pushliteral(L, "id");
    lua_rawget(L, 1);
    lua_pushliteral(L, "label");
    lua_rawget(L, 1);

    size_t id_len = 0;
    size_t label_len = 0;
    const char* id = raw_string(L, 2, &id_len);
    const char* label = raw_string(L, 3, &label_len);

    // Everything that can raise is done; only C++ from here on
    CapabilityApi* api = self(L);
    try {
        api->add_menu_item(id ? std::string(id, id_len) : std::string(),
                           label ? std::string(label, label_len) : std::string());
    } catch (const std::exception& e) {
        LOG_DEBUG("capability addMenuItem dropped: %s", e.what());
    }
    return 0;
}

int CapabilityApi::l_on_menu_click(lua_State* L) {
    size_t id_len = 0;
    const char* id = raw_string(L, 1, &id_len);
    if (!id || lua_type(L, 2) != LUA_TFUNCTION) return 0;

    lua_settop(L, 2);
    int ref = luaL_ref(L, LUA_REGISTRYINDEX);

    bool stored = false;
    CapabilityApi* api = self(L);
    try {
        stored = api->on_menu_click(std::string(id, id_len), ref);
    } catch (const std::exception& e) {
        LOG_DEBUG("capability onMenuClick dropped: %s", e.what());
    }
    if (!stored) {
        luaL_unref(L, LUA_REGISTRYINDEX, ref);
    }
    return 0;
}

int CapabilityApi::l_noop(lua_State*) {
    return 0;
}

int CapabilityApi::install_globals(lua_State* L) {
    void* api = lua_touserdata(L, 1);

    static const struct {
        const char* name;
        lua_CFunction fn;
    } functions[] = {
        {"say", &CapabilityApi::l_say},
        {"suggestion", &CapabilityApi::l_suggestion},
        {"addMenuItem", &CapabilityApi::l_add_menu_item},
        {"onMenuClick", &CapabilityApi::l_on_menu_click},
        {NULL, NULL}
    };
    for (int i = 0; functions[i].name; ++i) {
        lua_pushlightuserdata(L, api);
        lua_pushcclosure(L, functions[i].fn, 1);
        lua_setglobal(L, functions[i].name);
    }

    static const char* const console_methods[] = {
        "log", "info", "warn", "error", "debug", NULL
    };
    lua_newtable(L);
    for (const char* const* m = console_methods; *m; ++m) {
        lua_pushcfunction(L, &CapabilityApi::l_noop);
        lua_setfield(L, -2, *m);
    }
    lua_setglobal(L, "console");

    // module.exports and exports are the same table
    lua_newtable(L);
    lua_newtable(L);
    lua_pushvalue(L, -2);
    lua_setfield(L, -2, "exports");
    lua_setglobal(L, "module");
    lua_setglobal(L, "exports");
    return 0;
}

} // namespace parabox
