/*
 * parabox - Plugin catalog access
 *
 * CatalogClient is the narrow interface the installer needs from the remote
 * catalog service. HttpCatalogClient talks to the REST API:
 *   GET {base}/api/v1/plugins                  -> [{id,version,name,sha256,permissions}]
 *   GET {base}/api/v1/plugins/{id}/{version}   -> {manifest_json, code, sha256}
 */
#ifndef PARABOX_PLUGIN_CATALOG_HPP
#define PARABOX_PLUGIN_CATALOG_HPP

#include "types.hpp"
#include "../core/http_client.hpp"
#include <functional>
#include <mutex>
#include <string>

namespace parabox {

class CatalogClient {
public:
    virtual ~CatalogClient() {}

    // Raw catalog listing; entries are not filtered
    virtual CatalogResult list() = 0;

    // Bundle as reported by the server; not verified
    virtual BundleResult fetch_bundle(const std::string& id, const std::string& version) = 0;
};

// Returns the current bearer token, or "" when not logged in
typedef std::function<std::string()> TokenProvider;

class HttpCatalogClient : public CatalogClient {
public:
    HttpCatalogClient(const std::string& base_url, const TokenProvider& token_provider,
                      long timeout_ms);

    CatalogResult list() override;
    BundleResult fetch_bundle(const std::string& id, const std::string& version) override;

private:
    // Performs an authenticated GET; on failure sets error to a catalog error code
    bool get_json(const std::string& path, Json& out, std::string& error);

    std::string base_url_;
    TokenProvider token_provider_;
    HttpClient http_;
    std::mutex mutex_;
};

} // namespace parabox

#endif // PARABOX_PLUGIN_CATALOG_HPP
