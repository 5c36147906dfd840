#include <parabox/plugin/bundle_store.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

namespace parabox {

const char* const BundleStore::kEntryFile = "main.lua";
const char* const BundleStore::kManifestFile = "manifest.json";

BundleStore::BundleStore(const std::string& root)
    : root_(root)
{}

std::string BundleStore::encode_segment(const std::string& value) {
    static const char hex[] = "0123456789abcdef";

    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '-' || (c == '.' && i > 0);
        if (keep) {
            out += static_cast<char>(c);
        } else {
            out += '_';
            out += hex[c >> 4];
            out += hex[c & 0x0f];
        }
    }
    if (out.empty()) out = "_";
    return out;
}

std::string BundleStore::bundle_dir(const std::string& id, const std::string& version) const {
    return join_path(join_path(root_, encode_segment(id)), encode_segment(version));
}

std::string BundleStore::entry_path(const std::string& id, const std::string& version) const {
    return join_path(bundle_dir(id, version), kEntryFile);
}

std::string BundleStore::manifest_path(const std::string& id, const std::string& version) const {
    return join_path(bundle_dir(id, version), kManifestFile);
}

bool BundleStore::write(const std::string& id, const std::string& version,
                        const std::string& code, const std::string& manifest_json) const {
    std::string dir = bundle_dir(id, version);
    if (!mkdir_p(dir)) {
        LOG_ERROR("Cannot create bundle directory %s", dir.c_str());
        return false;
    }
    if (!write_file_atomic(entry_path(id, version), code)) {
        LOG_ERROR("Cannot write bundle entry for %s@%s", id.c_str(), version.c_str());
        return false;
    }
    if (!write_file_atomic(manifest_path(id, version), manifest_json)) {
        LOG_ERROR("Cannot write bundle manifest for %s@%s", id.c_str(), version.c_str());
        return false;
    }
    LOG_DEBUG("Bundle %s@%s written to %s", id.c_str(), version.c_str(), dir.c_str());
    return true;
}

bool BundleStore::has_entry(const std::string& id, const std::string& version) const {
    return is_regular_file(entry_path(id, version));
}

} // namespace parabox
