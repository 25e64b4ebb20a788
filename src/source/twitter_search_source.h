#pragma once

#include "source/i_event_source.h"
#include "source/http_client.h"

#include <string>

namespace heatcast {

struct TwitterCredentials {
    std::string client_id;
    std::string client_secret;
};

struct TwitterEndpoints {
    std::string token_url  = "https://api.twitter.com/oauth2/token";
    std::string search_url = "https://api.twitter.com/1.1/search/tweets.json";
};

/// Standard search API as an event source, authenticated with an app-only
/// bearer token from the client-credentials grant.
///
/// The token is fetched on first use and cached. A 401 on search drops the
/// cached token so the next call fetches a fresh one; nothing is retried
/// within a call. Intended for use from one thread (the sampler).
class TwitterSearchSource : public IEventSource {
public:
    explicit TwitterSearchSource(TwitterCredentials credentials,
                                 TwitterEndpoints endpoints = TwitterEndpoints());

    EventBatch search(const SearchQuery& query) override;

    bool hasToken() const { return !bearer_token_.empty(); }

    // Response handling (exposed for testing)

    /// "<search_url>?q=...&result_type=...&count=..."
    static std::string buildSearchUrl(const std::string& search_url, const SearchQuery& query);

    /// Extract id_str/created_at of each top-level status. Nested objects
    /// (user, retweeted_status) are ignored. Throws SourceError on malformed JSON
    /// or a missing "statuses" array.
    static EventBatch parseSearchResponse(const std::string& body);

    /// Throws SourceError unless the body carries a bearer access_token.
    static std::string parseTokenResponse(const std::string& body);

private:
    void fetchToken();

    TwitterCredentials credentials_;
    TwitterEndpoints endpoints_;
    HttpClient http_;
    std::string bearer_token_;
};

}  // namespace heatcast
