/*
 * parabox - Menu-click handler arena
 *
 * Maps menu ids to Lua registry references. The table owns every reference
 * it holds: replacing an id releases the previous reference first, and
 * dispose_all() releases everything. It must be disposed before the
 * lua_State it refers to is closed.
 */
#ifndef PARABOX_SANDBOX_HANDLER_TABLE_HPP
#define PARABOX_SANDBOX_HANDLER_TABLE_HPP

#include <lua.hpp>
#include <map>
#include <string>
#include <cstddef>

namespace parabox {

class HandlerTable {
public:
    HandlerTable(lua_State* L, size_t capacity);
    ~HandlerTable();

    // Stores ref under id, taking ownership of it. A new id is refused once
    // capacity distinct ids are held; an existing id is always replaced.
    // Returns false (and does not take ownership) when refused.
    bool set(const std::string& id, int ref);

    // Registry reference for id, or LUA_NOREF
    int get(const std::string& id) const;

    bool contains(const std::string& id) const;
    size_t size() const { return refs_.size(); }
    size_t capacity() const { return capacity_; }

    // Releases every reference; the table stays usable but empty
    void dispose_all();

    // Forgets the state without touching it. Called once the state is
    // closed; every later set() is refused.
    void detach();

private:
    HandlerTable(const HandlerTable&);
    HandlerTable& operator=(const HandlerTable&);

    lua_State* L_;
    size_t capacity_;
    std::map<std::string, int> refs_;
};

} // namespace parabox

#endif // PARABOX_SANDBOX_HANDLER_TABLE_HPP
