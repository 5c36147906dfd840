#include <parabox/sandbox/lua_runtime.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

#include <cstdlib>

namespace parabox {

namespace {

LuaRuntime* runtime_of(lua_State* L) {
    return *static_cast<LuaRuntime**>(lua_getextraspace(L));
}

const int kHookMask = LUA_MASKCALL | LUA_MASKRET | LUA_MASKCOUNT;

// Copies the error object on top of the stack without running metamethods
std::string error_text(lua_State* L) {
    if (lua_type(L, -1) == LUA_TSTRING) {
        size_t len = 0;
        const char* s = lua_tolstring(L, -1, &len);
        return std::string(s, len);
    }
    return "error object is not a string";
}

} // namespace

LuaRuntime::LuaRuntime(const SandboxLimits& limits)
    : L_(nullptr)
    , limits_(limits)
    , used_bytes_(0)
    , max_frames_(0)
    , depth_estimate_(0)
    , armed_(false)
    , deadline_hit_(false)
    , deadline_ms_(0)
    , watchdog_(nullptr)
{
    max_frames_ = limits_.stack_limit_bytes / kFrameCostBytes;
    if (max_frames_ < 16) max_frames_ = 16;

    L_ = lua_newstate(&LuaRuntime::allocate, this);
    if (!L_) {
        LOG_ERROR("Lua: cannot create state (memory limit %zu bytes)", limits_.memory_limit_bytes);
        return;
    }

    *static_cast<LuaRuntime**>(lua_getextraspace(L_)) = this;
    lua_atpanic(L_, &LuaRuntime::panic);
    lua_sethook(L_, &LuaRuntime::hook, kHookMask, kHookInstructionCount);

    std::string err;
    if (!protected_call(&LuaRuntime::open_sandbox_libs, nullptr, &err)) {
        LOG_ERROR("Lua: cannot open sandbox libraries: %s", err.c_str());
        lua_close(L_);
        L_ = nullptr;
    }
}

LuaRuntime::~LuaRuntime() {
    if (L_) {
        // Finalizers left by plugin code run during close; keep them bounded
        arm_deadline(limits_.click_timeout_ms);
        lua_close(L_);
        L_ = nullptr;
        disarm_deadline();
    }
}

void* LuaRuntime::allocate(void* ud, void* ptr, size_t osize, size_t nsize) {
    LuaRuntime* self = static_cast<LuaRuntime*>(ud);
    size_t old_size = ptr ? osize : 0;

    if (nsize == 0) {
        std::free(ptr);
        self->used_bytes_ -= old_size;
        return nullptr;
    }

    if (nsize > old_size &&
        self->used_bytes_ + (nsize - old_size) > self->limits_.memory_limit_bytes) {
        return nullptr;
    }

    void* p = std::realloc(ptr, nsize);
    if (!p) return nullptr;

    self->used_bytes_ = self->used_bytes_ - old_size + nsize;
    return p;
}

int LuaRuntime::exact_depth(lua_State* L) {
    lua_Debug ar;
    int lo = 0;
    int hi = 1;
    while (lua_getstack(L, hi, &ar)) {
        lo = hi;
        hi *= 2;
    }
    while (hi - lo > 1) {
        int mid = lo + (hi - lo) / 2;
        if (lua_getstack(L, mid, &ar)) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo + 1;
}

void LuaRuntime::hook(lua_State* L, lua_Debug* ar) {
    LuaRuntime* self = runtime_of(L);

    switch (ar->event) {
        case LUA_HOOKCALL: {
            // The estimate drifts upwards when errors unwind frames without
            // return events, so it only decides when to measure exactly.
            ++self->depth_estimate_;
            if (self->depth_estimate_ > static_cast<int>(self->max_frames_)) {
                lua_Debug frame;
                if (lua_getstack(L, static_cast<int>(self->max_frames_), &frame)) {
                    luaL_error(L, "stack ceiling exceeded");
                }
                self->depth_estimate_ = exact_depth(L);
            }
            break;
        }
        case LUA_HOOKRET:
            if (self->depth_estimate_ > 0) --self->depth_estimate_;
            break;
        case LUA_HOOKCOUNT:
            if (self->armed_ && monotonic_ms() >= self->deadline_ms_) {
                self->deadline_hit_ = true;
                // From now on check every instruction so a pcall in plugin
                // code cannot swallow the interrupt and keep running
                lua_sethook(L, &LuaRuntime::hook, kHookMask, 1);
                luaL_error(L, "deadline exceeded");
            }
            break;
        default:
            break;
    }
}

int LuaRuntime::open_sandbox_libs(lua_State* L) {
    static const luaL_Reg libs[] = {
        {LUA_GNAME, luaopen_base},
        {LUA_TABLIBNAME, luaopen_table},
        {LUA_STRLIBNAME, luaopen_string},
        {LUA_MATHLIBNAME, luaopen_math},
        {LUA_UTF8LIBNAME, luaopen_utf8},
        {LUA_COLIBNAME, luaopen_coroutine},
        {NULL, NULL}
    };
    for (const luaL_Reg* lib = libs; lib->func; ++lib) {
        luaL_requiref(L, lib->name, lib->func, 1);
        lua_pop(L, 1);
    }

    // No code loading, no direct collector control, no stdout
    static const char* const removed[] = {
        "dofile", "loadfile", "load", "require", "collectgarbage", "print", NULL
    };
    for (const char* const* name = removed; *name; ++name) {
        lua_pushnil(L);
        lua_setglobal(L, *name);
    }

    lua_getglobal(L, LUA_STRLIBNAME);
    lua_pushnil(L);
    lua_setfield(L, -2, "dump");
    lua_pop(L, 1);
    return 0;
}

int LuaRuntime::gc_step(lua_State* L) {
    lua_pushboolean(L, lua_gc(L, LUA_GCSTEP, 0));
    return 1;
}

int LuaRuntime::panic(lua_State* L) {
    LOG_ERROR("Lua: unprotected error: %s", lua_type(L, -1) == LUA_TSTRING ? lua_tostring(L, -1) : "?");
    return 0;
}

bool LuaRuntime::protected_call(lua_CFunction fn, void* ud, std::string* error) {
    if (!L_) return false;

    lua_pushcfunction(L_, fn);
    lua_pushlightuserdata(L_, ud);
    int status = lua_pcall(L_, 1, 0, 0);
    if (status != LUA_OK) {
        if (error) {
            *error = status == LUA_ERRMEM ? "memory limit exceeded" : error_text(L_);
        }
        lua_settop(L_, 0);
        return false;
    }
    return true;
}

void LuaRuntime::arm_deadline(int timeout_ms) {
    deadline_ms_ = monotonic_ms() + (timeout_ms > 0 ? timeout_ms : 0);
    deadline_hit_ = false;
    depth_estimate_ = 0;
    armed_ = true;
    lua_sethook(L_, &LuaRuntime::hook, kHookMask, kHookInstructionCount);
    if (watchdog_) {
        watchdog_->arm(deadline_ms_ + (limits_.watchdog_grace_ms > 0 ? limits_.watchdog_grace_ms : 0));
    }
}

void LuaRuntime::disarm_deadline() {
    armed_ = false;
    if (watchdog_) watchdog_->disarm();
}

ExecResult LuaRuntime::finish_call(int status) {
    if (status == LUA_OK) {
        drain_pending_jobs();
        lua_settop(L_, 0);
        return ExecResult::ok();
    }

    ExecResult result;
    if (deadline_hit_) {
        result = ExecResult::fail("deadline exceeded", true);
    } else if (status == LUA_ERRMEM) {
        result = ExecResult::fail("memory limit exceeded");
    } else {
        result = ExecResult::fail(error_text(L_));
    }
    lua_settop(L_, 0);
    return result;
}

ExecResult LuaRuntime::run_chunk(const std::string& code, const std::string& chunk_name, int timeout_ms) {
    if (!L_) return ExecResult::fail("runtime not initialized");

    std::string name = "=" + chunk_name;
    arm_deadline(timeout_ms);
    // Text mode only: precompiled chunks bypass the compiler's checks
    int status = luaL_loadbufferx(L_, code.data(), code.size(), name.c_str(), "t");
    if (status == LUA_OK) {
        status = lua_pcall(L_, 0, 0, 0);
    }
    ExecResult result = finish_call(status);
    disarm_deadline();
    return result;
}

ExecResult LuaRuntime::call_ref(int ref, int timeout_ms) {
    if (!L_) return ExecResult::fail("runtime not initialized");

    arm_deadline(timeout_ms);
    lua_rawgeti(L_, LUA_REGISTRYINDEX, ref);
    if (lua_type(L_, -1) != LUA_TFUNCTION) {
        lua_settop(L_, 0);
        disarm_deadline();
        return ExecResult::fail("handler is not a function");
    }
    int status = lua_pcall(L_, 0, 0, 0);
    ExecResult result = finish_call(status);
    disarm_deadline();
    return result;
}

int LuaRuntime::drain_pending_jobs() {
    int ran = 0;
    while (ran < limits_.max_drain_jobs) {
        lua_pushcfunction(L_, &LuaRuntime::gc_step);
        if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
            lua_pop(L_, 1);
            break;
        }
        bool cycle_done = lua_toboolean(L_, -1) != 0;
        lua_pop(L_, 1);
        ++ran;
        if (cycle_done) break;
    }
    return ran;
}

} // namespace parabox
