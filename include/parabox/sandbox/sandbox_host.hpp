/*
 * parabox - Sandbox host
 *
 * Command handling for one plugin host process. Accepts a single load
 * command per lifetime, then serves menu clicks until shutdown.
 *
 *   Idle -> Loading -> Ready -> Disposed
 *
 * Disposed is terminal: reached on shutdown or a failed load.
 *
 * With an overrun handler the host also runs a Watchdog. A load or click
 * that outlives its deadline by the grace period (stuck inside a library
 * call the instruction hook cannot interrupt) is reported to the handler
 * from the watchdog thread; the handler is expected to end the process.
 */
#ifndef PARABOX_SANDBOX_SANDBOX_HOST_HPP
#define PARABOX_SANDBOX_SANDBOX_HOST_HPP

#include "capability_api.hpp"
#include "handler_table.hpp"
#include "lua_runtime.hpp"
#include "watchdog.hpp"
#include "../core/json.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace parabox {

enum class HostState {
    Idle,
    Loading,
    Ready,
    Disposed
};

const char* host_state_name(HostState state);

// Receives the message the supervisor should see for the overrunning call:
// error{VM_EXEC_FAILED} during load, a failed click result during a click,
// null otherwise.
typedef std::function<void(const Json& last_message)> OverrunHandler;

class SandboxHost {
public:
    SandboxHost(const SandboxLimits& limits, const EventSink& sink,
                const OverrunHandler& on_overrun = OverrunHandler());
    ~SandboxHost();

    // Dispatches one supervisor command; unknown types are ignored
    void handle_command(const Json& cmd);

    // Releases handler references, then the interpreter
    void dispose();

    HostState state() const { return state_; }
    const std::string& plugin_id() const { return plugin_id_; }

    // True once the process should exit
    bool finished() const { return state_ == HostState::Disposed; }
    int exit_code() const { return exit_code_; }

    // Exit status used by host processes that end on a watchdog overrun
    static const int kOverrunExitCode = 3;

private:
    SandboxHost(const SandboxHost&);
    SandboxHost& operator=(const SandboxHost&);

    void handle_load(const Json& cmd);
    void handle_menu_click(const Json& cmd);
    void fail_load(const char* code, const std::string& detail);
    void emit(const Json& msg);
    void on_overrun();
    void set_busy(bool loading, const std::string& request_id);

    SandboxLimits limits_;
    EventSink sink_;
    HostState state_;
    bool load_seen_;
    int exit_code_;
    std::string plugin_id_;

    OverrunHandler on_overrun_;
    std::mutex busy_mutex_;
    bool busy_loading_;
    std::string busy_request_;

    std::unique_ptr<Watchdog> watchdog_;
    std::unique_ptr<LuaRuntime> runtime_;
    std::unique_ptr<HandlerTable> handlers_;
    std::unique_ptr<CapabilityApi> api_;
};

} // namespace parabox

#endif // PARABOX_SANDBOX_SANDBOX_HOST_HPP
