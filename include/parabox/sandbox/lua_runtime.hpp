/*
 * parabox - Sandboxed Lua runtime
 *
 * Owns one lua_State with:
 * - a memory ceiling enforced by the allocator
 * - a stack ceiling charged per active call frame
 * - a wall-clock deadline checked from an instruction-count hook, with an
 *   optional Watchdog armed past it for calls that never reach the hook
 * - a restricted standard library (no io/os/package/debug, no loaders)
 */
#ifndef PARABOX_SANDBOX_LUA_RUNTIME_HPP
#define PARABOX_SANDBOX_LUA_RUNTIME_HPP

#include "watchdog.hpp"
#include <lua.hpp>
#include <string>
#include <cstddef>
#include <cstdint>

namespace parabox {

struct SandboxLimits {
    size_t memory_limit_bytes;
    size_t stack_limit_bytes;
    int load_timeout_ms;        // top-level evaluation
    int click_timeout_ms;       // one menu-click handler invocation
    int max_drain_jobs;         // pending-job iterations after each call
    size_t max_menu_items;
    int watchdog_grace_ms;      // past the deadline before the watchdog fires

    SandboxLimits()
        : memory_limit_bytes(64 * 1024 * 1024)
        , stack_limit_bytes(512 * 1024)
        , load_timeout_ms(1000)
        , click_timeout_ms(400)
        , max_drain_jobs(64)
        , max_menu_items(10)
        , watchdog_grace_ms(250)
    {}
};

// Outcome of running plugin code
struct ExecResult {
    bool success;
    bool deadline_exceeded;
    std::string error;

    ExecResult() : success(false), deadline_exceeded(false) {}

    static ExecResult ok() {
        ExecResult r;
        r.success = true;
        return r;
    }

    static ExecResult fail(const std::string& err, bool deadline = false) {
        ExecResult r;
        r.success = false;
        r.deadline_exceeded = deadline;
        r.error = err;
        return r;
    }
};

class LuaRuntime {
public:
    explicit LuaRuntime(const SandboxLimits& limits);
    ~LuaRuntime();

    // False when the state could not be created or the libraries failed to open
    bool valid() const { return L_ != nullptr; }

    lua_State* state() { return L_; }

    // Runs fn(L) with ud as its only argument in protected mode.
    // Used for setup work that allocates (registering globals).
    bool protected_call(lua_CFunction fn, void* ud, std::string* error = nullptr);

    // Compiles code as a text chunk and runs it, bounded by timeout_ms.
    // Pending jobs are drained afterwards under the same deadline.
    ExecResult run_chunk(const std::string& code, const std::string& chunk_name, int timeout_ms);

    // Calls the function stored in the registry under ref with no arguments
    ExecResult call_ref(int ref, int timeout_ms);

    // Up to max_drain_jobs protected collector steps (finalizers run here).
    // Stops early when a cycle completes or a step raises. Returns steps run.
    int drain_pending_jobs();

    // Armed at deadline + limits.watchdog_grace_ms for every bounded call.
    // Not owned; must outlive the runtime.
    void set_watchdog(Watchdog* watchdog) { watchdog_ = watchdog; }

    size_t memory_used() const { return used_bytes_; }
    size_t max_frames() const { return max_frames_; }

    // Bytes charged against the stack ceiling for each active call frame
    static const size_t kFrameCostBytes = 256;

    // Instructions between deadline checks while the deadline has not passed
    static const int kHookInstructionCount = 1000;

private:
    LuaRuntime(const LuaRuntime&);
    LuaRuntime& operator=(const LuaRuntime&);

    static void* allocate(void* ud, void* ptr, size_t osize, size_t nsize);
    static void hook(lua_State* L, lua_Debug* ar);
    static int open_sandbox_libs(lua_State* L);
    static int gc_step(lua_State* L);
    static int panic(lua_State* L);
    static int exact_depth(lua_State* L);

    void arm_deadline(int timeout_ms);
    void disarm_deadline();
    ExecResult finish_call(int status);

    lua_State* L_;
    SandboxLimits limits_;
    size_t used_bytes_;
    size_t max_frames_;
    int depth_estimate_;
    bool armed_;
    bool deadline_hit_;
    int64_t deadline_ms_;
    Watchdog* watchdog_;
};

} // namespace parabox

#endif // PARABOX_SANDBOX_LUA_RUNTIME_HPP
