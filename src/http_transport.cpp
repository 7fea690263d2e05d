#include "shippack/http_transport.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace shippack {
namespace {

constexpr size_t kMaxErrorBody = 500;

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

size_t append_body(char* data, size_t size, size_t nmemb, void* user) {
    static_cast<std::string*>(user)->append(data, size * nmemb);
    return size * nmemb;
}

// curl_global_init is not thread-safe; run it once before any worker thread uses curl.
void global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

std::string post_json(
    const std::string& url,
    const std::string& authorization,
    long timeout_s,
    const std::string& body
) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("http: curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const std::string& h : {std::string("Content-Type: application/json"), "Authorization: " + authorization}) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next) {
            throw std::runtime_error("http: curl_slist_append failed");
        }
        headers.release();
        headers.reset(next);
    }

    std::string response;
    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        throw std::runtime_error("http: POST " + url + " failed: " + curl_easy_strerror(rc));
    }
    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw std::runtime_error("http: POST " + url + " returned " + std::to_string(status) + ": " +
                                 response.substr(0, kMaxErrorBody));
    }
    return response;
}

}  // namespace

RateTransport make_curl_transport(const RateServiceConfig& config) {
    if (config.base_url.empty()) {
        throw std::invalid_argument("make_curl_transport: base_url must not be empty");
    }
    if (config.timeout_s <= 0) {
        throw std::invalid_argument("make_curl_transport: timeout_s must be > 0");
    }
    global_init();

    const std::string base_url = config.base_url;
    const std::string scheme = config.auth_scheme;
    const long timeout_s = config.timeout_s;
    return [base_url, scheme, timeout_s](const std::string& path, const std::string& token, const std::string& body) {
        const std::string auth = scheme.empty() ? token : scheme + " " + token;
        return post_json(base_url + path, auth, timeout_s, body);
    };
}

}  // namespace shippack
