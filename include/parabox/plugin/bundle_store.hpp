/*
 * parabox - Bundle storage
 *
 * Verified bundles live at
 *   <root>/<enc(id)>/<enc(version)>/main.lua
 *   <root>/<enc(id)>/<enc(version)>/manifest.json
 * where enc() maps any string to a single safe path segment.
 */
#ifndef PARABOX_PLUGIN_BUNDLE_STORE_HPP
#define PARABOX_PLUGIN_BUNDLE_STORE_HPP

#include <string>

namespace parabox {

class BundleStore {
public:
    // root is the plugins directory, normally <data_dir>/plugins
    explicit BundleStore(const std::string& root);

    // Keeps [A-Za-z0-9.-], writes every other byte as _xx (lowercase hex).
    // A leading dot is escaped too, so "." and ".." never come out.
    static std::string encode_segment(const std::string& value);

    std::string bundle_dir(const std::string& id, const std::string& version) const;
    std::string entry_path(const std::string& id, const std::string& version) const;
    std::string manifest_path(const std::string& id, const std::string& version) const;

    // Writes code then manifest, each via temp file + rename
    bool write(const std::string& id, const std::string& version,
               const std::string& code, const std::string& manifest_json) const;

    bool has_entry(const std::string& id, const std::string& version) const;

    const std::string& root() const { return root_; }

    static const char* const kEntryFile;
    static const char* const kManifestFile;

private:
    std::string root_;
};

} // namespace parabox

#endif // PARABOX_PLUGIN_BUNDLE_STORE_HPP
