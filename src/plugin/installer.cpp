#include <parabox/plugin/installer.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

namespace parabox {

Installer::Installer(CatalogClient& catalog, const BundleStore& store)
    : catalog_(catalog)
    , store_(store)
{}

bool Installer::is_approved(const PluginCatalogEntry& entry) {
    if (trim(entry.id).empty() || trim(entry.version).empty() || trim(entry.name).empty()) {
        return false;
    }
    if (entry.sha256.size() < kMinHashChars || !is_hex(entry.sha256)) {
        return false;
    }
    return is_valid_permissions(entry.permissions);
}

CatalogResult Installer::list_approved() {
    CatalogResult listed = catalog_.list();
    if (!listed.success) {
        return listed;
    }

    std::vector<PluginCatalogEntry> approved;
    for (std::vector<PluginCatalogEntry>::const_iterator it = listed.entries.begin();
         it != listed.entries.end(); ++it) {
        if (is_approved(*it)) {
            approved.push_back(*it);
        } else {
            LOG_DEBUG("Skipping catalog entry '%s@%s'", it->id.c_str(), it->version.c_str());
        }
    }
    return CatalogResult::ok(approved);
}

bool Installer::resolve(const std::vector<PluginCatalogEntry>& entries,
                        const InstallSelection& selection,
                        PluginCatalogEntry& out) {
    if (entries.empty()) return false;

    std::string want_id = trim(selection.plugin_id);
    std::string want_version = trim(selection.version);

    if (!want_id.empty() && !want_version.empty()) {
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].id == want_id && entries[i].version == want_version) {
                out = entries[i];
                return true;
            }
        }
    }
    if (!want_id.empty()) {
        for (size_t i = 0; i < entries.size(); ++i) {
            if (entries[i].id == want_id) {
                out = entries[i];
                return true;
            }
        }
    }
    out = entries[0];
    return true;
}

BundleResult Installer::download(const PluginCatalogEntry& entry) {
    BundleResult fetched = catalog_.fetch_bundle(entry.id, entry.version);
    if (!fetched.success) {
        return fetched;
    }

    const PluginBundle& bundle = fetched.bundle;
    if (bundle.manifest_json.empty() || bundle.code.empty() || bundle.sha256.empty()) {
        LOG_WARN("Incomplete bundle for %s@%s", entry.id.c_str(), entry.version.c_str());
        return BundleResult::fail(errors::kDownloadFailed);
    }

    std::string local_hash = sha256_hex(bundle.code);
    if (local_hash != to_lower(trim(bundle.sha256))) {
        LOG_WARN("Bundle %s@%s does not match the server hash", entry.id.c_str(), entry.version.c_str());
        return BundleResult::fail(errors::kSha256Mismatch);
    }
    if (local_hash != to_lower(trim(entry.sha256))) {
        LOG_WARN("Bundle %s@%s does not match the catalog hash", entry.id.c_str(), entry.version.c_str());
        return BundleResult::fail(errors::kSha256Mismatch);
    }

    if (!store_.write(entry.id, entry.version, bundle.code, bundle.manifest_json)) {
        return BundleResult::fail(errors::kBundleWriteFailed);
    }

    BundleResult result = BundleResult::ok(bundle);
    result.entry_path = store_.entry_path(entry.id, entry.version);
    LOG_INFO("Installed bundle %s@%s (%zu bytes)", entry.id.c_str(), entry.version.c_str(),
             bundle.code.size());
    return result;
}

} // namespace parabox
