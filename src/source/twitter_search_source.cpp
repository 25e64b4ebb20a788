#include "source/twitter_search_source.h"
#include "core/errors.h"

#include <nlohmann/json.hpp>

#include <utility>
#include <vector>

namespace heatcast {

using json = nlohmann::json;

namespace {

constexpr long kHttpUnauthorized = 401;

std::string describe(const HttpResponse& resp) {
    if (resp.body.empty()) return resp.error_message;
    // API errors come back as {"errors":[{"code":..,"message":..}]}
    const json doc = json::parse(resp.body, nullptr, false);
    if (doc.is_object() && doc.contains("errors") && doc["errors"].is_array() &&
        !doc["errors"].empty() && doc["errors"][0].is_object()) {
        const json& first = doc["errors"][0];
        if (first.contains("message") && first["message"].is_string())
            return resp.error_message + " (" + first["message"].get<std::string>() + ")";
    }
    return resp.error_message;
}

}  // namespace

TwitterSearchSource::TwitterSearchSource(TwitterCredentials credentials,
                                         TwitterEndpoints endpoints)
    : credentials_(std::move(credentials)), endpoints_(std::move(endpoints)) {}

std::string TwitterSearchSource::buildSearchUrl(const std::string& search_url,
                                                const SearchQuery& query) {
    return search_url +
           "?q=" + HttpClient::escape(query.keyword) +
           "&result_type=" + HttpClient::escape(query.result_type) +
           "&count=" + std::to_string(query.count);
}

EventBatch TwitterSearchSource::parseSearchResponse(const std::string& body) {
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded())
        throw SourceError("search: response is not valid JSON");
    if (!doc.is_object() || !doc.contains("statuses") || !doc["statuses"].is_array())
        throw SourceError("search: response has no \"statuses\" array");

    EventBatch batch;
    batch.reserve(doc["statuses"].size());
    for (const json& status : doc["statuses"]) {
        if (!status.is_object())
            throw SourceError("search: status entry is not an object");
        EventItem item;
        if (status.contains("id_str") && status["id_str"].is_string())
            item.id = status["id_str"].get<std::string>();
        else if (status.contains("id") && status["id"].is_number_integer())
            item.id = std::to_string(status["id"].get<long long>());
        // A missing created_at stays empty and fails timestamp parsing later,
        // which aborts the iteration the same way a malformed one does.
        if (status.contains("created_at") && status["created_at"].is_string())
            item.created_at = status["created_at"].get<std::string>();
        batch.push_back(std::move(item));
    }
    return batch;
}

std::string TwitterSearchSource::parseTokenResponse(const std::string& body) {
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        throw SourceError("token: response is not a JSON object");
    if (!doc.contains("access_token") || !doc["access_token"].is_string())
        throw SourceError("token: response has no access_token");
    if (doc.contains("token_type") && doc["token_type"].is_string() &&
        doc["token_type"].get<std::string>() != "bearer")
        throw SourceError("token: unexpected token_type " + doc["token_type"].get<std::string>());
    std::string token = doc["access_token"].get<std::string>();
    if (token.empty())
        throw SourceError("token: empty access_token");
    return token;
}

void TwitterSearchSource::fetchToken() {
    const BasicAuth auth{credentials_.client_id, credentials_.client_secret};
    const std::vector<std::string> headers = {
        "Content-Type: application/x-www-form-urlencoded;charset=UTF-8"
    };

    HttpResponse resp;
    if (!http_.post(endpoints_.token_url, "grant_type=client_credentials", headers, resp, &auth))
        throw SourceError("token: " + describe(resp), resp.status_code);

    bearer_token_ = parseTokenResponse(resp.body);
}

EventBatch TwitterSearchSource::search(const SearchQuery& query) {
    if (bearer_token_.empty())
        fetchToken();

    const std::vector<std::string> headers = {
        "Authorization: Bearer " + bearer_token_
    };

    HttpResponse resp;
    if (!http_.get(buildSearchUrl(endpoints_.search_url, query), headers, resp)) {
        if (resp.status_code == kHttpUnauthorized)
            bearer_token_.clear();
        throw SourceError("search q=" + query.keyword + ": " + describe(resp), resp.status_code);
    }

    return parseSearchResponse(resp.body);
}

}  // namespace heatcast
