#include <parabox/plugin/catalog.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

namespace parabox {

HttpCatalogClient::HttpCatalogClient(const std::string& base_url, const TokenProvider& token_provider,
                                     long timeout_ms)
    : base_url_(base_url)
    , token_provider_(token_provider)
{
    while (!base_url_.empty() && base_url_[base_url_.size() - 1] == '/') {
        base_url_.erase(base_url_.size() - 1);
    }
    http_.set_timeout(timeout_ms);
    http_.set_user_agent("parabox/1.0");
}

bool HttpCatalogClient::get_json(const std::string& path, Json& out, std::string& error) {
    std::string token = token_provider_ ? trim(token_provider_()) : std::string();
    if (token.empty()) {
        error = errors::kNotLoggedIn;
        return false;
    }

    HttpClient::Headers headers;
    headers["Authorization"] = "Bearer " + token;

    HttpResponse response = http_.get(base_url_ + path, headers);
    if (response.transport_failed()) {
        LOG_WARN("Catalog request %s failed: %s", path.c_str(), response.error.c_str());
        error = errors::kNetworkError;
        return false;
    }
    if (response.status_code == 401) {
        error = errors::kNotLoggedIn;
        return false;
    }
    if (!response.ok()) {
        LOG_WARN("Catalog request %s returned HTTP %ld", path.c_str(), response.status_code);
        error = errors::kApiFailed;
        return false;
    }

    if (!response.json(out)) {
        LOG_WARN("Catalog request %s returned malformed JSON", path.c_str());
        error = errors::kApiFailed;
        return false;
    }
    return true;
}

CatalogResult HttpCatalogClient::list() {
    std::lock_guard<std::mutex> lock(mutex_);

    Json body;
    std::string error;
    if (!get_json("/api/v1/plugins", body, error)) {
        return CatalogResult::fail(error);
    }
    if (!body.is_array()) {
        LOG_WARN("Catalog listing is not an array");
        return CatalogResult::fail(errors::kApiFailed);
    }

    std::vector<PluginCatalogEntry> entries;
    const std::vector<Json>& items = body.as_array();
    for (std::vector<Json>::const_iterator it = items.begin(); it != items.end(); ++it) {
        if (it->is_object()) {
            entries.push_back(catalog_entry_from_json(*it));
        }
    }
    LOG_DEBUG("Catalog listed %zu entries", entries.size());
    return CatalogResult::ok(entries);
}

BundleResult HttpCatalogClient::fetch_bundle(const std::string& id, const std::string& version) {
    std::lock_guard<std::mutex> lock(mutex_);

    Json body;
    std::string error;
    std::string path = "/api/v1/plugins/" + http_.escape(id) + "/" + http_.escape(version);
    if (!get_json(path, body, error)) {
        return BundleResult::fail(error);
    }
    if (!body.is_object()) {
        return BundleResult::fail(errors::kApiFailed);
    }

    PluginBundle bundle;
    bundle.manifest_json = body.get_string("manifest_json");
    bundle.code = body.get_string("code");
    bundle.sha256 = body.get_string("sha256");
    return BundleResult::ok(bundle);
}

} // namespace parabox
