/*
 * parabox - Plugin data model
 *
 * Catalog entries, the persisted installation state, status snapshots and
 * the result structs returned by the plugin manager. JSON renderings use
 * camelCase keys.
 */
#ifndef PARABOX_PLUGIN_TYPES_HPP
#define PARABOX_PLUGIN_TYPES_HPP

#include "../core/json.hpp"
#include <string>
#include <vector>

namespace parabox {

// Error codes returned by the plugin manager and its collaborators
namespace errors {
const char* const kNoApprovedPlugins = "NO_APPROVED_PLUGINS";
const char* const kSha256Mismatch = "SHA256_MISMATCH";
const char* const kDownloadFailed = "DOWNLOAD_FAILED";
const char* const kNotLoggedIn = "NOT_LOGGED_IN";
const char* const kNetworkError = "NETWORK_ERROR";
const char* const kApiFailed = "API_FAILED";
const char* const kBundleWriteFailed = "BUNDLE_WRITE_FAILED";
const char* const kStateWriteFailed = "STATE_WRITE_FAILED";
const char* const kPermissionsRequired = "PERMISSIONS_REQUIRED";
const char* const kNotInstalledOnDisk = "PLUGIN_NOT_INSTALLED_ON_DISK";
const char* const kPluginsDisabled = "PLUGINS_DISABLED";
const char* const kNotRunning = "PLUGIN_NOT_RUNNING";
const char* const kPluginMismatch = "PLUGIN_MISMATCH";
const char* const kTooManyPending = "TOO_MANY_PENDING";
const char* const kTimeout = "TIMEOUT";
const char* const kHostSendFailed = "PLUGIN_HOST_SEND_FAILED";
const char* const kHostStopped = "PLUGIN_HOST_STOPPED";
const char* const kHostExited = "PLUGIN_HOST_EXITED";
const char* const kHostError = "PLUGIN_HOST_ERROR";
const char* const kHostSpawnFailed = "PLUGIN_HOST_SPAWN_FAILED";
const char* const kCalledFromListener = "CALLED_FROM_LISTENER";
} // namespace errors

// An approved plugin as listed by the catalog
struct PluginCatalogEntry {
    std::string id;
    std::string version;
    std::string name;
    std::string sha256;
    Json permissions;
};

// The single installed plugin, as persisted
struct InstalledPluginRef {
    std::string id;
    std::string version;
    std::string name;
    std::string sha256;
    Json permissions;
};

struct PluginRuntimeState {
    bool enabled;
    bool has_installed;
    InstalledPluginRef installed;

    PluginRuntimeState() : enabled(false), has_installed(false) {}
};

struct MenuItemDescriptor {
    std::string plugin_id;
    std::string id;
    std::string label;
};

struct PluginStatus {
    bool enabled;
    bool has_installed;
    InstalledPluginRef installed;
    bool running;
    std::vector<MenuItemDescriptor> menu_items;
    std::string last_error;     // empty when none

    PluginStatus() : enabled(false), has_installed(false), running(false) {}
};

// say / suggestion relayed to the presentation layer
struct PluginOutputEvent {
    std::string type;
    std::string plugin_id;
    std::string text;
};

// A downloaded bundle before verification
struct PluginBundle {
    std::string manifest_json;
    std::string code;
    std::string sha256;
};

// Optional install target; empty fields mean "not specified"
struct InstallSelection {
    std::string plugin_id;
    std::string version;
};

// ============================================================================
// Result types
// ============================================================================

struct StatusResult {
    bool success;
    std::string error;
    PluginStatus status;

    StatusResult() : success(false) {}

    static StatusResult ok(const PluginStatus& status) {
        StatusResult r;
        r.success = true;
        r.status = status;
        return r;
    }

    static StatusResult fail(const std::string& err) {
        StatusResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

struct CatalogResult {
    bool success;
    std::string error;
    std::vector<PluginCatalogEntry> entries;

    CatalogResult() : success(false) {}

    static CatalogResult ok(const std::vector<PluginCatalogEntry>& entries) {
        CatalogResult r;
        r.success = true;
        r.entries = entries;
        return r;
    }

    static CatalogResult fail(const std::string& err) {
        CatalogResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

struct BundleResult {
    bool success;
    std::string error;
    PluginBundle bundle;
    std::string entry_path;     // set once written to disk

    BundleResult() : success(false) {}

    static BundleResult ok(const PluginBundle& bundle) {
        BundleResult r;
        r.success = true;
        r.bundle = bundle;
        return r;
    }

    static BundleResult fail(const std::string& err) {
        BundleResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

struct MenuClickResult {
    bool success;
    std::string error;

    MenuClickResult() : success(false) {}

    static MenuClickResult ok() {
        MenuClickResult r;
        r.success = true;
        return r;
    }

    static MenuClickResult fail(const std::string& err) {
        MenuClickResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// ============================================================================
// JSON conversion
// ============================================================================

// Declared permissions must be an object or an array
bool is_valid_permissions(const Json& permissions);

// Reads the fields present in obj; no validation beyond types
PluginCatalogEntry catalog_entry_from_json(const Json& obj);
Json to_json(const PluginCatalogEntry& entry);

InstalledPluginRef installed_ref_from_entry(const PluginCatalogEntry& entry);
// False when obj lacks a non-empty id or version
bool installed_ref_from_json(const Json& obj, InstalledPluginRef& out);
Json to_json(const InstalledPluginRef& ref);

// Lenient: anything malformed falls back to the defaults
PluginRuntimeState runtime_state_from_json(const Json& obj);
Json to_json(const PluginRuntimeState& state);

Json to_json(const MenuItemDescriptor& item);
Json to_json(const std::vector<MenuItemDescriptor>& items);
Json to_json(const PluginStatus& status);
Json to_json(const PluginOutputEvent& event);

} // namespace parabox

#endif // PARABOX_PLUGIN_TYPES_HPP
