#include "source/http_client.h"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace heatcast {

namespace {

struct CurlGlobalInit {
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

// curl_global_init is not thread-safe; run it once before main().
static CurlGlobalInit g_curl_global_init;

struct EasyDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t appendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

}  // namespace

HttpClient::HttpClient(long connect_timeout_sec, long total_timeout_sec)
    : connect_timeout_sec_(connect_timeout_sec), total_timeout_sec_(total_timeout_sec) {}

bool HttpClient::get(const std::string& url,
                     const std::vector<std::string>& headers,
                     HttpResponse& response) {
    return perform("GET", url, nullptr, headers, nullptr, response);
}

bool HttpClient::post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers,
                      HttpResponse& response,
                      const BasicAuth* auth) {
    return perform("POST", url, &body, headers, auth, response);
}

std::string HttpClient::escape(const std::string& s) {
    EasyHandle h(curl_easy_init());
    if (!h) throw std::runtime_error("HttpClient: curl_easy_init failed");
    char* escaped = curl_easy_escape(h.get(), s.data(), static_cast<int>(s.size()));
    if (!escaped) throw std::runtime_error("HttpClient: curl_easy_escape failed");
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

bool HttpClient::perform(const std::string& method,
                         const std::string& url,
                         const std::string* body,
                         const std::vector<std::string>& headers,
                         const BasicAuth* auth,
                         HttpResponse& response) {
    response = HttpResponse();

    EasyHandle h(curl_easy_init());
    if (!h) {
        response.error_message = "curl_easy_init failed";
        return false;
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& line : headers) {
        curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
        if (!appended) {
            curl_slist_free_all(raw_headers);
            response.error_message = "curl_slist_append failed";
            return false;
        }
        raw_headers = appended;
    }
    HeaderList header_list(raw_headers);

    CURL* c = h.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, connect_timeout_sec_);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, total_timeout_sec_);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &response.body);
    if (header_list)
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, header_list.get());
    if (auth) {
        curl_easy_setopt(c, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(c, CURLOPT_USERNAME, auth->user.c_str());
        curl_easy_setopt(c, CURLOPT_PASSWORD, auth->password.c_str());
    }
    if (method == "POST") {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body ? body->size() : 0));
    }

    const CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        response.error_message = method + " " + url + ": " + curl_easy_strerror(rc);
        return false;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.success = response.status_code >= 200 && response.status_code < 300;
    if (!response.success)
        response.error_message = method + " " + url + ": HTTP " + std::to_string(response.status_code);
    return response.success;
}

}  // namespace heatcast
