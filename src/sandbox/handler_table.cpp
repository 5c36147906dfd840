#include <parabox/sandbox/handler_table.hpp>

namespace parabox {

HandlerTable::HandlerTable(lua_State* L, size_t capacity)
    : L_(L)
    , capacity_(capacity)
{}

HandlerTable::~HandlerTable() {
    dispose_all();
}

bool HandlerTable::set(const std::string& id, int ref) {
    if (!L_) return false;

    std::map<std::string, int>::iterator it = refs_.find(id);
    if (it != refs_.end()) {
        luaL_unref(L_, LUA_REGISTRYINDEX, it->second);
        it->second = ref;
        return true;
    }
    if (refs_.size() >= capacity_) {
        return false;
    }
    refs_[id] = ref;
    return true;
}

int HandlerTable::get(const std::string& id) const {
    std::map<std::string, int>::const_iterator it = refs_.find(id);
    return it != refs_.end() ? it->second : LUA_NOREF;
}

bool HandlerTable::contains(const std::string& id) const {
    return refs_.find(id) != refs_.end();
}

void HandlerTable::dispose_all() {
    if (L_) {
        for (std::map<std::string, int>::iterator it = refs_.begin(); it != refs_.end(); ++it) {
            luaL_unref(L_, LUA_REGISTRYINDEX, it->second);
        }
    }
    refs_.clear();
}

void HandlerTable::detach() {
    L_ = nullptr;
    refs_.clear();
}

} // namespace parabox
