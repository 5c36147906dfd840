/*
 * parabox - Bundle acquisition and verification
 *
 * Filters the catalog down to installable entries, resolves an install
 * selection, and downloads a bundle whose SHA-256 must match both the
 * catalog-declared and the server-reported hash before anything is written.
 */
#ifndef PARABOX_PLUGIN_INSTALLER_HPP
#define PARABOX_PLUGIN_INSTALLER_HPP

#include "bundle_store.hpp"
#include "catalog.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace parabox {

class Installer {
public:
    Installer(CatalogClient& catalog, const BundleStore& store);

    // Catalog entries with id, version, name, a hash of at least
    // kMinHashChars hex digits and object/array permissions
    CatalogResult list_approved();

    // Exact (id, version) match, else id match, else the first entry.
    // False only when entries is empty.
    static bool resolve(const std::vector<PluginCatalogEntry>& entries,
                        const InstallSelection& selection,
                        PluginCatalogEntry& out);

    // Fetches, verifies and stores the bundle for entry. On success
    // entry_path in the result points at the written main.lua.
    BundleResult download(const PluginCatalogEntry& entry);

    static bool is_approved(const PluginCatalogEntry& entry);

    static const size_t kMinHashChars = 16;

private:
    CatalogClient& catalog_;
    const BundleStore& store_;
};

} // namespace parabox

#endif // PARABOX_PLUGIN_INSTALLER_HPP
