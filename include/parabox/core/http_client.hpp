#ifndef PARABOX_CORE_HTTP_CLIENT_HPP
#define PARABOX_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <curl/curl.h>

namespace parabox {

struct HttpResponse {
    long status_code;
    std::string body;
    std::string error;          // Transport error (empty when a status was received)

    HttpResponse() : status_code(0) {}

    bool ok() const { return status_code >= 200 && status_code < 300; }
    bool transport_failed() const { return status_code == 0; }

    // Parses the body; false when it is not JSON
    bool json(Json& out) const {
        return parse_json(body, out);
    }
};

// Blocking GET-only client over libcurl; one easy handle reused per instance.
// Not thread-safe; callers serialize access.
class HttpClient {
public:
    typedef std::map<std::string, std::string> Headers;

    HttpClient();
    ~HttpClient();

    void set_timeout(long ms);
    void set_user_agent(const std::string& ua);
    void set_max_body_bytes(size_t bytes);

    HttpResponse get(const std::string& url, const Headers& headers = Headers());

    // Percent-encodes a single path segment
    std::string escape(const std::string& s);

    static const size_t kDefaultMaxBodyBytes = 16 * 1024 * 1024;

private:
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    struct BodySink {
        std::string* body;
        size_t limit;
        bool overflowed;
    };

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURL* curl_;
    long timeout_ms_;
    size_t max_body_bytes_;
    std::string user_agent_;
};

} // namespace parabox

#endif // PARABOX_CORE_HTTP_CLIENT_HPP
