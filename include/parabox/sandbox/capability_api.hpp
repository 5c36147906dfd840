/*
 * parabox - Capability API
 *
 * The fixed set of globals plugin code can use to reach the host:
 *   say(text), suggestion(text), addMenuItem{id=, label=}, onMenuClick(id, fn),
 *   console.log/info/warn/error/debug (discarded), module/exports (empty tables)
 *
 * Every violation is a silent no-op; plugin code never sees an error raised
 * by these functions.
 */
#ifndef PARABOX_SANDBOX_CAPABILITY_API_HPP
#define PARABOX_SANDBOX_CAPABILITY_API_HPP

#include "handler_table.hpp"
#include "lua_runtime.hpp"
#include "../core/json.hpp"
#include <functional>
#include <string>

namespace parabox {

// Receives protocol events produced by plugin code
typedef std::function<void(const Json&)> EventSink;

class CapabilityApi {
public:
    CapabilityApi(const std::string& plugin_id,
                  HandlerTable& handlers,
                  const EventSink& sink,
                  size_t max_menu_items);

    // Registers the globals in runtime's global table
    bool install(LuaRuntime& runtime, std::string* error = nullptr);

    void say(const std::string& text);
    void suggestion(const std::string& text);
    void add_menu_item(const std::string& id, const std::string& label);

    // Takes ownership of ref on success; the caller releases it otherwise
    bool on_menu_click(const std::string& id, int ref);

    size_t menu_item_count() const { return menu_count_; }
    const std::string& plugin_id() const { return plugin_id_; }

private:
    void emit(const Json& msg);
    void emit_text(bool is_say, const char* s, size_t len);

    static CapabilityApi* self(lua_State* L);
    static int install_globals(lua_State* L);
    static int l_say(lua_State* L);
    static int l_suggestion(lua_State* L);
    static int l_add_menu_item(lua_State* L);
    static int l_on_menu_click(lua_State* L);
    static int l_noop(lua_State* L);

    std::string plugin_id_;
    HandlerTable& handlers_;
    EventSink sink_;
    size_t max_menu_items_;
    size_t menu_count_;
};

} // namespace parabox

#endif // PARABOX_SANDBOX_CAPABILITY_API_HPP
