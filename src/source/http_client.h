#pragma once

#include <memory>
#include <string>
#include <vector>

namespace heatcast {

struct HttpResponse {
    long status_code = 0;       // 0 when no HTTP response was received
    std::string body;
    bool success = false;       // 2xx
    std::string error_message;
};

struct BasicAuth {
    std::string user;
    std::string password;
};

/// Blocking HTTP(S) client on libcurl's easy interface. One easy handle per
/// request; not shared between threads.
class HttpClient {
public:
    explicit HttpClient(long connect_timeout_sec = 10, long total_timeout_sec = 30);

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Each header is a full "Name: value" line.
    /// Returns response.success; transport failures leave status_code at 0
    /// and describe the cause in error_message.
    bool get(const std::string& url,
             const std::vector<std::string>& headers,
             HttpResponse& response);

    bool post(const std::string& url,
              const std::string& body,
              const std::vector<std::string>& headers,
              HttpResponse& response,
              const BasicAuth* auth = nullptr);

    /// Percent-encode a query component.
    static std::string escape(const std::string& s);

private:
    bool perform(const std::string& method,
                 const std::string& url,
                 const std::string* body,
                 const std::vector<std::string>& headers,
                 const BasicAuth* auth,
                 HttpResponse& response);

    long connect_timeout_sec_;
    long total_timeout_sec_;
};

}  // namespace heatcast
