#include <parabox/plugin/manager.hpp>
#include <parabox/ipc/protocol.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

#include <chrono>

namespace parabox {

namespace {

// Set while this thread is inside an output listener
thread_local bool t_in_listener = false;

class ListenerScope {
public:
    ListenerScope() { t_in_listener = true; }
    ~ListenerScope() { t_in_listener = false; }
};

} // namespace

PluginManager::PluginManager(const ManagerOptions& options, CatalogClient& catalog)
    : options_(options)
    , store_(join_path(options.data_dir, StateStore::kFileName))
    , bundles_(join_path(options.data_dir, "plugins"))
    , installer_(catalog, bundles_)
    , remote_enabled_(options.remote_enabled)
    , next_listener_id_(1)
{
    options_.host.limits.max_menu_items = options_.max_menu_items;
}

PluginManager::~PluginManager() {
    shutdown();
}

// ============================================================================
// Locked helpers (mutex_ held)
// ============================================================================

bool PluginManager::execution_allowed_locked() const {
    return state_.enabled && remote_enabled_ && state_.has_installed;
}

PluginStatus PluginManager::status_locked() const {
    PluginStatus status;
    status.enabled = state_.enabled;
    status.has_installed = state_.has_installed;
    status.installed = state_.installed;
    status.running = host_ != nullptr;
    status.menu_items = menu_items_;
    status.last_error = last_error_;
    return status;
}

void PluginManager::reject_pending_locked(const char* code) {
    for (std::map<std::string, PendingClick>::iterator it = pending_.begin(); it != pending_.end(); ++it) {
        it->second->set_value(MenuClickResult::fail(code));
    }
    if (!pending_.empty()) {
        LOG_DEBUG("Rejected %zu pending menu clicks: %s", pending_.size(), code);
    }
    pending_.clear();
}

// ============================================================================
// Host lifecycle (ops_mutex_ held, mutex_ released)
// ============================================================================

void PluginManager::join_retired_hosts() {
    std::vector<std::shared_ptr<HostProcess> > retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retired_hosts_);
    }
    for (size_t i = 0; i < retired.size(); ++i) {
        retired[i]->terminate(0);
    }
}

void PluginManager::stop_host() {
    std::shared_ptr<HostProcess> host;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        host.swap(host_);
        host_plugin_id_.clear();
        host_version_.clear();
        reject_pending_locked(errors::kHostStopped);
        menu_items_.clear();
    }
    if (host) {
        LOG_INFO("Stopping plugin host");
        host->terminate(options_.stop_grace_ms);
    }
    join_retired_hosts();
}

bool PluginManager::start_host() {
    InstalledPluginRef installed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.has_installed) return false;
        installed = state_.installed;

        if (!is_valid_permissions(installed.permissions)) {
            LOG_WARN("Plugin %s declares no permissions, not starting", installed.id.c_str());
            last_error_ = errors::kPermissionsRequired;
            return false;
        }
    }

    std::string entry_path = bundles_.entry_path(installed.id, installed.version);
    if (!is_regular_file(entry_path)) {
        LOG_WARN("Plugin %s@%s is not on disk (%s)", installed.id.c_str(), installed.version.c_str(),
                 entry_path.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = errors::kNotInstalledOnDisk;
        return false;
    }

    std::shared_ptr<HostProcess> host(new HostProcess(
        options_.host,
        [this](HostProcess* origin, const Json& msg) { on_host_message(origin, msg); },
        [this](HostProcess* origin, int status) { on_host_exit(origin, status); }));

    // Current before it can produce events, so none of them look stale
    {
        std::lock_guard<std::mutex> lock(mutex_);
        host_ = host;
        host_plugin_id_ = installed.id;
        host_version_ = installed.version;
        menu_items_.clear();
    }

    std::string error;
    if (!host->start(&error)) {
        LOG_ERROR("Cannot start plugin host: %s", error.c_str());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (host_ == host) {
                host_.reset();
                host_plugin_id_.clear();
                host_version_.clear();
            }
            last_error_ = errors::kHostSpawnFailed;
        }
        host->terminate(0);
        return false;
    }

    Json load = protocol::make_load(installed.id, installed.version, entry_path, installed.permissions);
    if (!host->send(load)) {
        LOG_ERROR("Cannot send load command to plugin host");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (host_ == host) {
                host_.reset();
                host_plugin_id_.clear();
                host_version_.clear();
                reject_pending_locked(errors::kHostError);
                menu_items_.clear();
            }
            last_error_ = errors::kHostError;
        }
        host->terminate(0);
        return false;
    }

    LOG_INFO("Plugin %s@%s starting", installed.id.c_str(), installed.version.c_str());
    return true;
}

void PluginManager::apply_effective_state() {
    bool allowed = false;
    bool up_to_date = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        allowed = execution_allowed_locked();
        up_to_date = host_ != nullptr &&
                     host_plugin_id_ == state_.installed.id &&
                     host_version_ == state_.installed.version;
    }

    if (!allowed) {
        stop_host();
        return;
    }
    if (up_to_date) {
        join_retired_hosts();
        return;
    }
    stop_host();
    start_host();
}

// ============================================================================
// Host events (reader thread)
// ============================================================================

void PluginManager::on_host_message(HostProcess* origin, const Json& msg) {
    std::string type = protocol::message_type(msg);
    std::vector<OutputListener> listeners;
    PluginOutputEvent event;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!host_ || host_.get() != origin) {
            LOG_DEBUG("Ignoring '%s' from a stale plugin host", type.c_str());
            return;
        }

        if (type == protocol::kMenuClickResult) {
            std::string request_id = msg.get_string("requestId");
            std::map<std::string, PendingClick>::iterator it = pending_.find(request_id);
            if (it == pending_.end()) {
                LOG_DEBUG("Ignoring result for unknown request %s", request_id.c_str());
                return;
            }
            if (msg.get_bool("ok", false)) {
                it->second->set_value(MenuClickResult::ok());
            } else {
                std::string error = msg.get_string("error");
                it->second->set_value(MenuClickResult::fail(error.empty() ? protocol::kMenuClickFailed : error));
            }
            pending_.erase(it);
            return;
        }

        if (type == protocol::kError) {
            std::string message = clip_text(msg.get_string("message"), protocol::kSayMaxChars);
            last_error_ = message.empty() ? errors::kHostError : message;
            LOG_WARN("Plugin host reported: %s", last_error_.c_str());
            return;
        }

        if (type == protocol::kMenuAdd) {
            const Json& item = msg["item"];
            if (!item.is_object()) return;

            std::string id = clip_text(item.get_string("id"), protocol::kMenuIdMaxChars);
            std::string label = clip_text(item.get_string("label"), protocol::kMenuLabelMaxChars);
            if (id.empty() || label.empty()) return;

            for (std::vector<MenuItemDescriptor>::iterator it = menu_items_.begin(); it != menu_items_.end(); ++it) {
                if (it->id == id) {
                    it->label = label;
                    return;
                }
            }
            if (menu_items_.size() >= options_.max_menu_items) {
                LOG_DEBUG("Menu item '%s' dropped: limit reached", id.c_str());
                return;
            }
            MenuItemDescriptor descriptor;
            descriptor.plugin_id = host_plugin_id_;
            descriptor.id = id;
            descriptor.label = label;
            menu_items_.push_back(descriptor);
            return;
        }

        if (type == protocol::kSay || type == protocol::kSuggestion) {
            size_t max_chars = type == protocol::kSay ? protocol::kSayMaxChars : protocol::kSuggestionMaxChars;
            event.type = type;
            event.plugin_id = host_plugin_id_;
            event.text = clip_text(msg.get_string("text"), max_chars);
            if (event.text.empty()) return;

            for (std::map<int, OutputListener>::const_iterator it = listeners_.begin(); it != listeners_.end(); ++it) {
                listeners.push_back(it->second);
            }
        } else {
            if (type != protocol::kReady) {
                LOG_DEBUG("Ignoring host message '%s'", type.c_str());
            }
            return;
        }
    }

    ListenerScope scope;
    for (size_t i = 0; i < listeners.size(); ++i) {
        try {
            listeners[i](event);
        } catch (const std::exception& e) {
            LOG_WARN("Output listener failed: %s", e.what());
        }
    }
}

void PluginManager::on_host_exit(HostProcess* origin, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!host_ || host_.get() != origin) return;

    LOG_WARN("Plugin host exited unexpectedly (%s)", HostProcess::describe_status(status).c_str());
    // Joined later; this runs on the host's own reader thread
    retired_hosts_.push_back(host_);
    host_.reset();
    host_plugin_id_.clear();
    host_version_.clear();
    reject_pending_locked(errors::kHostExited);
    menu_items_.clear();
}

// ============================================================================
// Operations
// ============================================================================

bool PluginManager::called_from_listener(const char* op) {
    if (!t_in_listener) return false;
    LOG_ERROR("PluginManager::%s called from an output listener; refused", op);
    return true;
}

void PluginManager::init() {
    if (called_from_listener("init")) return;
    std::lock_guard<std::mutex> ops(ops_mutex_);

    PluginRuntimeState loaded = store_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = loaded;
    }
    LOG_INFO("Plugin state: enabled=%s installed=%s", loaded.enabled ? "yes" : "no",
             loaded.has_installed ? (loaded.installed.id + "@" + loaded.installed.version).c_str() : "none");
    apply_effective_state();
}

void PluginManager::set_remote_plugins_enabled(bool enabled) {
    if (called_from_listener("set_remote_plugins_enabled")) return;
    std::lock_guard<std::mutex> ops(ops_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remote_enabled_ == enabled) return;
        remote_enabled_ = enabled;
    }
    LOG_INFO("Remote plugin flag %s", enabled ? "on" : "off");
    apply_effective_state();
}

StatusResult PluginManager::set_enabled(bool enabled) {
    if (called_from_listener("set_enabled")) {
        return StatusResult::fail(errors::kCalledFromListener);
    }
    std::lock_guard<std::mutex> ops(ops_mutex_);

    PluginRuntimeState next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.enabled == enabled) {
            return StatusResult::ok(status_locked());
        }
        next = state_;
    }

    next.enabled = enabled;
    if (!store_.save(next)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = errors::kStateWriteFailed;
        return StatusResult::fail(errors::kStateWriteFailed);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.enabled = enabled;
        if (enabled) last_error_.clear();
    }
    LOG_INFO("Plugins %s", enabled ? "enabled" : "disabled");
    apply_effective_state();

    std::lock_guard<std::mutex> lock(mutex_);
    return StatusResult::ok(status_locked());
}

CatalogResult PluginManager::list_approved() {
    return installer_.list_approved();
}

StatusResult PluginManager::install(const InstallSelection& selection) {
    if (called_from_listener("install")) {
        return StatusResult::fail(errors::kCalledFromListener);
    }
    std::lock_guard<std::mutex> ops(ops_mutex_);
    join_retired_hosts();

    CatalogResult catalog = installer_.list_approved();
    if (!catalog.success) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = catalog.error;
        return StatusResult::fail(catalog.error);
    }

    PluginCatalogEntry target;
    if (!Installer::resolve(catalog.entries, selection, target)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = errors::kNoApprovedPlugins;
        return StatusResult::fail(errors::kNoApprovedPlugins);
    }

    LOG_INFO("Installing plugin %s@%s", target.id.c_str(), target.version.c_str());
    BundleResult bundle = installer_.download(target);
    if (!bundle.success) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = bundle.error;
        return StatusResult::fail(bundle.error);
    }

    PluginRuntimeState next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next = state_;
    }
    next.has_installed = true;
    next.installed = installed_ref_from_entry(target);
    if (!store_.save(next)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = errors::kStateWriteFailed;
        return StatusResult::fail(errors::kStateWriteFailed);
    }

    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = next;
        last_error_.clear();
        allowed = execution_allowed_locked();
    }

    stop_host();
    if (allowed) {
        start_host();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return StatusResult::ok(status_locked());
}

MenuClickResult PluginManager::click_menu_item(const std::string& plugin_id, const std::string& id) {
    if (called_from_listener("click_menu_item")) {
        return MenuClickResult::fail(errors::kCalledFromListener);
    }
    std::shared_ptr<HostProcess> host;
    std::string request_id;
    std::string target_plugin;
    std::future<MenuClickResult> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!execution_allowed_locked()) {
            return MenuClickResult::fail(errors::kPluginsDisabled);
        }
        if (!host_) {
            return MenuClickResult::fail(errors::kNotRunning);
        }
        target_plugin = trim(plugin_id);
        if (target_plugin != state_.installed.id) {
            return MenuClickResult::fail(errors::kPluginMismatch);
        }
        if (pending_.size() >= options_.max_pending_clicks) {
            return MenuClickResult::fail(errors::kTooManyPending);
        }

        request_id = generate_uuid();
        PendingClick pending(new std::promise<MenuClickResult>());
        future = pending->get_future();
        pending_[request_id] = pending;
        host = host_;
    }

    if (!host->send(protocol::make_menu_click(target_plugin, id, request_id))) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, PendingClick>::iterator it = pending_.find(request_id);
        if (it != pending_.end()) {
            pending_.erase(it);
            return MenuClickResult::fail(errors::kHostSendFailed);
        }
        // Settled while sending (host stopped or exited)
        return future.get();
    }

    if (future.wait_for(std::chrono::milliseconds(options_.click_timeout_ms)) == std::future_status::ready) {
        return future.get();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, PendingClick>::iterator it = pending_.find(request_id);
        if (it != pending_.end()) {
            pending_.erase(it);
            LOG_DEBUG("Menu click %s timed out", request_id.c_str());
            return MenuClickResult::fail(errors::kTimeout);
        }
    }
    return future.get();
}

PluginStatus PluginManager::get_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_locked();
}

std::vector<MenuItemDescriptor> PluginManager::get_menu_items() {
    std::lock_guard<std::mutex> lock(mutex_);
    return menu_items_;
}

int PluginManager::add_output_listener(const OutputListener& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    int listener_id = next_listener_id_++;
    listeners_[listener_id] = listener;
    return listener_id;
}

void PluginManager::remove_output_listener(int listener_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(listener_id);
}

size_t PluginManager::pending_click_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

pid_t PluginManager::host_pid() {
    std::lock_guard<std::mutex> lock(mutex_);
    return host_ ? host_->pid() : -1;
}

void PluginManager::shutdown() {
    if (called_from_listener("shutdown")) return;
    std::lock_guard<std::mutex> ops(ops_mutex_);
    stop_host();
}

} // namespace parabox
