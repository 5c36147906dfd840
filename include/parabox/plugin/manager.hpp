/*
 * parabox - Plugin manager
 *
 * Lifecycle authority for the single plugin slot:
 * - enablement gating (local toggle AND remote flag AND something installed)
 * - catalog listing, bundle install and state persistence
 * - host process start/stop and crash handling (no automatic restart)
 * - menu-click request bookkeeping with a supervisor-side timeout
 * - relaying say/suggestion output to registered listeners
 *
 * Locking: mutex_ guards state shared with the host reader threads.
 * ops_mutex_ serializes the mutating operations (init, set_enabled,
 * set_remote_plugins_enabled, install, shutdown) for their whole duration.
 * Hosts are always terminated with mutex_ released.
 */
#ifndef PARABOX_PLUGIN_MANAGER_HPP
#define PARABOX_PLUGIN_MANAGER_HPP

#include "bundle_store.hpp"
#include "catalog.hpp"
#include "host_process.hpp"
#include "installer.hpp"
#include "state_store.hpp"
#include "types.hpp"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parabox {

struct ManagerOptions {
    std::string data_dir;
    HostOptions host;
    bool remote_enabled;
    int click_timeout_ms;
    size_t max_pending_clicks;
    size_t max_menu_items;
    int stop_grace_ms;

    ManagerOptions()
        : remote_enabled(false)
        , click_timeout_ms(1200)
        , max_pending_clicks(20)
        , max_menu_items(10)
        , stop_grace_ms(200)
    {}
};

// Runs on the host's reader thread, outside the manager lock. Listeners may
// read status and menu items but must not call init, set_enabled,
// set_remote_plugins_enabled, install, click_menu_item or shutdown: those
// stop or wait on the very thread delivering the event. Such calls are
// refused (CALLED_FROM_LISTENER, or logged and ignored for the void ones);
// hand the work to another thread instead.
typedef std::function<void(const PluginOutputEvent&)> OutputListener;

class PluginManager {
public:
    PluginManager(const ManagerOptions& options, CatalogClient& catalog);
    ~PluginManager();

    // Loads persisted state (defaults on any error) and applies it
    void init();

    // Remote kill switch; no-op when unchanged
    void set_remote_plugins_enabled(bool enabled);

    // Local toggle; persisted. No-op (no write, no restart) when unchanged.
    StatusResult set_enabled(bool enabled);

    CatalogResult list_approved();

    StatusResult install(const InstallSelection& selection = InstallSelection());

    // Blocks until the host answers or click_timeout_ms passes
    MenuClickResult click_menu_item(const std::string& plugin_id, const std::string& id);

    PluginStatus get_status();
    std::vector<MenuItemDescriptor> get_menu_items();

    int add_output_listener(const OutputListener& listener);
    void remove_output_listener(int listener_id);

    // Stops the host; the manager can be initialized again afterwards
    void shutdown();

    // Number of menu clicks awaiting an answer
    size_t pending_click_count();

    // Process id of the running host, or -1
    pid_t host_pid();

private:
    PluginManager(const PluginManager&);
    PluginManager& operator=(const PluginManager&);

    typedef std::shared_ptr<std::promise<MenuClickResult> > PendingClick;

    bool execution_allowed_locked() const;
    PluginStatus status_locked() const;
    void reject_pending_locked(const char* code);

    // Called with ops_mutex_ held and mutex_ released
    void apply_effective_state();
    void stop_host();
    bool start_host();
    void join_retired_hosts();

    // True, after logging, when op was called from an output listener
    static bool called_from_listener(const char* op);

    void on_host_message(HostProcess* origin, const Json& msg);
    void on_host_exit(HostProcess* origin, int status);

    ManagerOptions options_;
    StateStore store_;
    BundleStore bundles_;
    Installer installer_;

    std::mutex ops_mutex_;

    std::mutex mutex_;
    PluginRuntimeState state_;
    bool remote_enabled_;
    std::shared_ptr<HostProcess> host_;
    std::string host_plugin_id_;
    std::string host_version_;
    std::vector<std::shared_ptr<HostProcess> > retired_hosts_;
    std::vector<MenuItemDescriptor> menu_items_;
    std::map<std::string, PendingClick> pending_;
    std::string last_error_;
    std::map<int, OutputListener> listeners_;
    int next_listener_id_;
};

} // namespace parabox

#endif // PARABOX_PLUGIN_MANAGER_HPP
