#include <parabox/core/http_client.hpp>
#include <parabox/core/logger.hpp>

namespace parabox {

HttpClient::HttpClient()
    : curl_(curl_easy_init())
    , timeout_ms_(30000)
    , max_body_bytes_(kDefaultMaxBodyBytes)
    , user_agent_("parabox/1.0")
{
    if (!curl_) {
        LOG_ERROR("curl_easy_init failed; HTTP requests will fail");
    }
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long ms) {
    timeout_ms_ = ms;
}

void HttpClient::set_user_agent(const std::string& ua) {
    user_agent_ = ua;
}

void HttpClient::set_max_body_bytes(size_t bytes) {
    max_body_bytes_ = bytes;
}

std::string HttpClient::escape(const std::string& s) {
    if (!curl_) return s;
    char* encoded = curl_easy_escape(curl_, s.c_str(), static_cast<int>(s.length()));
    if (!encoded) return s;
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    BodySink* sink = static_cast<BodySink*>(userdata);
    if (sink->body->size() + total > sink->limit) {
        sink->overflowed = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->body->append(ptr, total);
    return total;
}

HttpResponse HttpClient::get(const std::string& url, const Headers& headers) {
    HttpResponse resp;

    if (!curl_) {
        resp.error = "CURL not initialized";
        return resp;
    }

    curl_easy_reset(curl_);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_ / 2);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    struct curl_slist* header_list = nullptr;
    for (Headers::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        std::string header = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    header_list = curl_slist_append(header_list, "Accept: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    BodySink sink;
    sink.body = &resp.body;
    sink.limit = max_body_bytes_;
    sink.overflowed = false;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &sink);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        resp.error = sink.overflowed ? "response body too large" : curl_easy_strerror(res);
        resp.body.clear();
        LOG_DEBUG("HTTP GET %s failed: %s", url.c_str(), resp.error.c_str());
        return resp;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);
    if (!resp.ok()) {
        LOG_DEBUG("HTTP GET %s -> %ld", url.c_str(), resp.status_code);
    }
    return resp;
}

} // namespace parabox
