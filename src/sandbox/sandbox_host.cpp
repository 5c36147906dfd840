#include <parabox/sandbox/sandbox_host.hpp>
#include <parabox/ipc/protocol.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

namespace parabox {

const int SandboxHost::kOverrunExitCode;

const char* host_state_name(HostState state) {
    switch (state) {
        case HostState::Idle: return "idle";
        case HostState::Loading: return "loading";
        case HostState::Ready: return "ready";
        case HostState::Disposed: return "disposed";
    }
    return "unknown";
}

SandboxHost::SandboxHost(const SandboxLimits& limits, const EventSink& sink,
                         const OverrunHandler& on_overrun)
    : limits_(limits)
    , sink_(sink)
    , state_(HostState::Idle)
    , load_seen_(false)
    , exit_code_(0)
    , on_overrun_(on_overrun)
    , busy_loading_(false)
{
    if (on_overrun_) {
        watchdog_.reset(new Watchdog([this]() { on_overrun(); }));
    }
}

SandboxHost::~SandboxHost() {
    dispose();
    // Joined before the members the overrun path reads go away
    watchdog_.reset();
}

void SandboxHost::emit(const Json& msg) {
    if (sink_) sink_(msg);
}

void SandboxHost::set_busy(bool loading, const std::string& request_id) {
    std::lock_guard<std::mutex> lock(busy_mutex_);
    busy_loading_ = loading;
    busy_request_ = request_id;
}

void SandboxHost::on_overrun() {
    Json last;
    {
        std::lock_guard<std::mutex> lock(busy_mutex_);
        if (busy_loading_) {
            last = protocol::make_error(protocol::kVmExecFailed);
        } else if (!busy_request_.empty()) {
            last = protocol::make_click_result(busy_request_, false, protocol::kMenuClickFailed);
        }
    }
    LOG_ERROR("plugin %s overran its deadline by more than %d ms", plugin_id_.c_str(),
              limits_.watchdog_grace_ms);
    on_overrun_(last);
}

void SandboxHost::handle_command(const Json& cmd) {
    if (state_ == HostState::Disposed) return;

    std::string type = protocol::message_type(cmd);
    if (type == protocol::kLoad) {
        handle_load(cmd);
    } else if (type == protocol::kMenuClick) {
        handle_menu_click(cmd);
    } else if (type == protocol::kShutdown) {
        LOG_DEBUG("shutdown requested");
        dispose();
    } else {
        LOG_DEBUG("ignoring command '%s'", type.c_str());
    }
}

void SandboxHost::fail_load(const char* code, const std::string& detail) {
    LOG_ERROR("load failed: %s%s%s", code, detail.empty() ? "" : ": ", detail.c_str());
    emit(protocol::make_error(code));
    exit_code_ = 1;
    dispose();
}

void SandboxHost::handle_load(const Json& cmd) {
    if (load_seen_) {
        LOG_DEBUG("ignoring repeated load");
        return;
    }
    load_seen_ = true;
    state_ = HostState::Loading;

    std::string plugin_id = trim(cmd.get_string("pluginId"));
    std::string version = trim(cmd.get_string("version"));
    std::string entry_path = trim(cmd.get_string("entryPath"));
    if (plugin_id.empty() || version.empty() || entry_path.empty()) {
        fail_load(protocol::kInvalidLoadCmd, "");
        return;
    }

    if (!protocol::is_permissions_value(cmd["permissions"])) {
        fail_load(protocol::kPermissionsRequired, "");
        return;
    }

    std::string code;
    if (!read_file(entry_path, code)) {
        fail_load(protocol::kEntryReadFailed, entry_path);
        return;
    }

    plugin_id_ = plugin_id;

    runtime_.reset(new LuaRuntime(limits_));
    if (!runtime_->valid()) {
        fail_load(protocol::kVmInitFailed, "");
        return;
    }
    runtime_->set_watchdog(watchdog_.get());
    handlers_.reset(new HandlerTable(runtime_->state(), limits_.max_menu_items));
    api_.reset(new CapabilityApi(plugin_id_, *handlers_, sink_, limits_.max_menu_items));

    std::string err;
    if (!api_->install(*runtime_, &err)) {
        fail_load(protocol::kVmInitFailed, err);
        return;
    }

    set_busy(true, "");
    ExecResult result = runtime_->run_chunk(code, plugin_id_ + "@" + version, limits_.load_timeout_ms);
    set_busy(false, "");
    if (!result.success) {
        fail_load(protocol::kVmExecFailed, result.error);
        return;
    }

    state_ = HostState::Ready;
    LOG_INFO("plugin %s@%s loaded (%zu bytes in use)", plugin_id_.c_str(), version.c_str(),
             runtime_->memory_used());
}

void SandboxHost::handle_menu_click(const Json& cmd) {
    std::string request_id = clip_text(cmd.get_string("requestId"), protocol::kRequestIdMaxChars);
    if (request_id.empty()) return;

    if (state_ != HostState::Ready) {
        emit(protocol::make_click_result(request_id, false, protocol::kNotLoaded));
        return;
    }
    if (trim(cmd.get_string("pluginId")) != plugin_id_) {
        emit(protocol::make_click_result(request_id, false, protocol::kPluginMismatch));
        return;
    }

    std::string id = clip_text(cmd.get_string("id"), protocol::kMenuIdMaxChars);
    if (id.empty()) {
        emit(protocol::make_click_result(request_id, false, protocol::kInvalidMenuId));
        return;
    }

    int ref = handlers_->get(id);
    if (ref == LUA_NOREF) {
        emit(protocol::make_click_result(request_id, false, protocol::kNoHandler));
        return;
    }

    set_busy(false, request_id);
    ExecResult result = runtime_->call_ref(ref, limits_.click_timeout_ms);
    set_busy(false, "");
    if (!result.success) {
        LOG_DEBUG("menu handler '%s' failed: %s", id.c_str(), result.error.c_str());
        emit(protocol::make_click_result(request_id, false, protocol::kMenuClickFailed));
        return;
    }
    emit(protocol::make_click_result(request_id, true));
}

void SandboxHost::dispose() {
    if (handlers_) handlers_->dispose_all();
    // Finalizers run inside lua_close and may still call the capability API
    runtime_.reset();
    if (handlers_) handlers_->detach();
    api_.reset();
    handlers_.reset();
    state_ = HostState::Disposed;
}

} // namespace parabox
