#include <gtest/gtest.h>
#include "source/twitter_search_source.h"
#include "core/errors.h"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using socket_t = SOCKET;
    constexpr socket_t kBadSocket = INVALID_SOCKET;
    inline int close_sock(socket_t s) { return closesocket(s); }

    struct WsaGuard {
        WsaGuard() { WSADATA w; WSAStartup(MAKEWORD(2, 2), &w); }
        ~WsaGuard() { WSACleanup(); }
    };
#else
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <unistd.h>
    using socket_t = int;
    constexpr socket_t kBadSocket = -1;
    inline int close_sock(socket_t s) { return close(s); }

    struct WsaGuard {};
#endif

namespace heatcast {
namespace test {

static const char* kSearchBody = R"({
  "statuses": [
    {
      "created_at": "Wed Oct 10 20:19:30 +0000 2018",
      "id": 1050118621198921728,
      "id_str": "1050118621198921728",
      "text": "newest",
      "user": { "id_str": "6253282", "created_at": "Wed May 23 06:01:13 +0000 2007" },
      "retweeted_status": { "id_str": "1", "created_at": "Mon Jan 01 00:00:00 +0000 2018" }
    },
    {
      "created_at": "Wed Oct 10 20:19:27 +0000 2018",
      "id_str": "1050118621198921727",
      "text": "middle"
    },
    {
      "created_at": "Wed Oct 10 20:19:24 +0000 2018",
      "id": 1050118621198921726,
      "text": "oldest, numeric id only"
    }
  ],
  "search_metadata": { "count": 100, "query": "%23youtube" }
})";

TEST(TwitterSearchSource, ParsesTopLevelStatusesOnly) {
    EventBatch batch = TwitterSearchSource::parseSearchResponse(kSearchBody);
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(batch[0].id, "1050118621198921728");
    EXPECT_EQ(batch[0].created_at, "Wed Oct 10 20:19:30 +0000 2018");
    EXPECT_EQ(batch[1].created_at, "Wed Oct 10 20:19:27 +0000 2018");
    EXPECT_EQ(batch[2].id, "1050118621198921726");
    EXPECT_EQ(batch[2].created_at, "Wed Oct 10 20:19:24 +0000 2018");
}

TEST(TwitterSearchSource, EmptyStatusesIsAnEmptyBatch) {
    EventBatch batch = TwitterSearchSource::parseSearchResponse(R"({"statuses":[]})");
    EXPECT_TRUE(batch.empty());
}

TEST(TwitterSearchSource, MissingCreatedAtLeftEmpty) {
    EventBatch batch = TwitterSearchSource::parseSearchResponse(
        R"({"statuses":[{"id_str":"9"}]})");
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch[0].id, "9");
    EXPECT_TRUE(batch[0].created_at.empty());
}

TEST(TwitterSearchSource, MalformedSearchBodyIsSourceError) {
    EXPECT_THROW(TwitterSearchSource::parseSearchResponse("not json"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseSearchResponse("{}"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseSearchResponse(R"({"statuses":{}})"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseSearchResponse(R"({"statuses":[1,2]})"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseSearchResponse("[]"), SourceError);
}

TEST(TwitterSearchSource, ParsesBearerToken) {
    EXPECT_EQ(TwitterSearchSource::parseTokenResponse(
                  R"({"token_type":"bearer","access_token":"AAAA%2FAAA"})"),
              "AAAA%2FAAA");
}

TEST(TwitterSearchSource, RejectsBadTokenResponses) {
    EXPECT_THROW(TwitterSearchSource::parseTokenResponse("oops"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseTokenResponse(R"({"token_type":"bearer"})"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseTokenResponse(
                     R"({"token_type":"mac","access_token":"x"})"), SourceError);
    EXPECT_THROW(TwitterSearchSource::parseTokenResponse(
                     R"({"token_type":"bearer","access_token":""})"), SourceError);
}

TEST(TwitterSearchSource, BuildsEscapedSearchUrl) {
    SearchQuery q;
    q.keyword = "#youtube cats";
    const std::string url = TwitterSearchSource::buildSearchUrl(
        "https://api.twitter.com/1.1/search/tweets.json", q);
    EXPECT_EQ(url,
              "https://api.twitter.com/1.1/search/tweets.json"
              "?q=%23youtube%20cats&result_type=recent&count=100");
}

TEST(TwitterSearchSource, UnreachableTokenEndpointIsSourceError) {
    TwitterEndpoints ep;
    ep.token_url  = "http://127.0.0.1:1/oauth2/token";
    ep.search_url = "http://127.0.0.1:1/search";
    TwitterSearchSource source(TwitterCredentials{"id", "secret"}, ep);

    SearchQuery q;
    q.keyword = "#youtube";
    try {
        source.search(q);
        FAIL() << "expected SourceError";
    } catch (const SourceError& e) {
        EXPECT_EQ(e.httpStatus(), 0);
        EXPECT_NE(std::string(e.what()).find("token"), std::string::npos) << e.what();
    }
    EXPECT_FALSE(source.hasToken());
}

// ---------------------------------------------------------------------------
// Token caching against a loopback HTTP responder
// ---------------------------------------------------------------------------

/// Minimal HTTP/1.1 responder on an ephemeral loopback port. Serves one
/// request per connection with a canned reply per path and records what
/// it was asked.
class LoopbackHttpServer {
public:
    struct Reply {
        int status = 200;
        std::string body;
    };

    struct Request {
        std::string method;
        std::string path;
        std::string authorization;
    };

    LoopbackHttpServer() {
        sock_ = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (sock_ == kBadSocket) throw std::runtime_error("socket() failed");

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (bind(sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            listen(sock_, 8) != 0) {
            close_sock(sock_);
            throw std::runtime_error("bind()/listen() failed");
        }

        socklen_t len = sizeof(addr);
        getsockname(sock_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackHttpServer() {
        running_.store(false);
        thread_.join();
        close_sock(sock_);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    void setReply(const std::string& path, int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mu_);
        replies_[path] = Reply{status, body};
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

    int hits(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mu_);
        int n = 0;
        for (const auto& r : requests_)
            if (r.path == path) ++n;
        return n;
    }

private:
    void serve() {
        while (running_.load()) {
            fd_set fds;
            FD_ZERO(&fds);
            FD_SET(sock_, &fds);
            struct timeval tv { 0, 20000 };
            if (select(static_cast<int>(sock_) + 1, &fds, nullptr, nullptr, &tv) <= 0)
                continue;
            socket_t conn = accept(sock_, nullptr, nullptr);
            if (conn == kBadSocket) continue;
            handle(conn);
            close_sock(conn);
        }
    }

    void handle(socket_t conn) {
        std::string raw;
        char buf[2048];
        size_t header_end = std::string::npos;
        size_t content_length = 0;
        for (;;) {
            if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length)
                break;
            const long n = static_cast<long>(recv(conn, buf, sizeof(buf), 0));
            if (n <= 0) return;
            raw.append(buf, static_cast<size_t>(n));
            if (header_end == std::string::npos) {
                header_end = raw.find("\r\n\r\n");
                if (header_end != std::string::npos)
                    content_length = headerValueSize(raw.substr(0, header_end));
            }
        }

        Request req;
        const size_t sp1 = raw.find(' ');
        const size_t sp2 = raw.find(' ', sp1 + 1);
        req.method = raw.substr(0, sp1);
        req.path = raw.substr(sp1 + 1, sp2 - sp1 - 1);
        const size_t q = req.path.find('?');
        if (q != std::string::npos) req.path.resize(q);
        req.authorization = header(raw.substr(0, header_end), "Authorization");

        Reply reply{404, "{}"};
        {
            std::lock_guard<std::mutex> lock(mu_);
            requests_.push_back(req);
            auto it = replies_.find(req.path);
            if (it != replies_.end()) reply = it->second;
        }

        const std::string out =
            "HTTP/1.1 " + std::to_string(reply.status) + " X\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + std::to_string(reply.body.size()) + "\r\n"
            "Connection: close\r\n\r\n" + reply.body;
        send(conn, out.data(), static_cast<int>(out.size()), 0);
    }

    static std::string header(const std::string& head, const std::string& name) {
        const std::string key = "\r\n" + name + ": ";
        const size_t at = head.find(key);
        if (at == std::string::npos) return "";
        const size_t start = at + key.size();
        return head.substr(start, head.find("\r\n", start) - start);
    }

    static size_t headerValueSize(const std::string& head) {
        const std::string v = header(head, "Content-Length");
        return v.empty() ? 0 : static_cast<size_t>(std::strtoul(v.c_str(), nullptr, 10));
    }

    WsaGuard wsa_;
    socket_t sock_;
    uint16_t port_ = 0;
    std::atomic<bool> running_{true};
    std::thread thread_;
    mutable std::mutex mu_;
    std::map<std::string, Reply> replies_;
    std::vector<Request> requests_;
};

static const char* kTwoStatuses = R"({"statuses":[
    {"id_str":"2","created_at":"Wed Oct 10 20:19:27 +0000 2018"},
    {"id_str":"1","created_at":"Wed Oct 10 20:19:24 +0000 2018"}]})";

class TwitterTokenTest : public ::testing::Test {
protected:
    TwitterTokenTest()
        : source_(TwitterCredentials{"id", "secret"}, endpoints()) {
        query_.keyword = "#youtube";
        server_.setReply("/oauth2/token", 200, R"({"token_type":"bearer","access_token":"tok-1"})");
        server_.setReply("/search", 200, kTwoStatuses);
    }

    TwitterEndpoints endpoints() const {
        TwitterEndpoints ep;
        ep.token_url = server_.url("/oauth2/token");
        ep.search_url = server_.url("/search");
        return ep;
    }

    LoopbackHttpServer server_;
    TwitterSearchSource source_;
    SearchQuery query_;
};

TEST_F(TwitterTokenTest, TokenFetchedLazily) {
    EXPECT_FALSE(source_.hasToken());
    EXPECT_EQ(server_.hits("/oauth2/token"), 0);
}

TEST_F(TwitterTokenTest, OneTokenServesManySearches) {
    EXPECT_EQ(source_.search(query_).size(), 2u);
    EXPECT_TRUE(source_.hasToken());
    EXPECT_EQ(source_.search(query_).size(), 2u);

    EXPECT_EQ(server_.hits("/oauth2/token"), 1);
    EXPECT_EQ(server_.hits("/search"), 2);

    const auto reqs = server_.requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].authorization.rfind("Basic ", 0), 0u) << reqs[0].authorization;
    EXPECT_EQ(reqs[1].method, "GET");
    EXPECT_EQ(reqs[1].authorization, "Bearer tok-1");
    EXPECT_EQ(reqs[2].authorization, "Bearer tok-1");
}

TEST_F(TwitterTokenTest, UnauthorizedDropsTokenAndNextSearchRefetches) {
    source_.search(query_);
    ASSERT_TRUE(source_.hasToken());

    server_.setReply("/search", 401, R"({"errors":[{"code":89,"message":"Invalid or expired token."}]})");
    try {
        source_.search(query_);
        FAIL() << "expected SourceError";
    } catch (const SourceError& e) {
        EXPECT_EQ(e.httpStatus(), 401);
        EXPECT_NE(std::string(e.what()).find("Invalid or expired token."), std::string::npos) << e.what();
    }
    EXPECT_FALSE(source_.hasToken());
    EXPECT_EQ(server_.hits("/oauth2/token"), 1);

    server_.setReply("/oauth2/token", 200, R"({"token_type":"bearer","access_token":"tok-2"})");
    server_.setReply("/search", 200, kTwoStatuses);
    EXPECT_EQ(source_.search(query_).size(), 2u);
    EXPECT_EQ(server_.hits("/oauth2/token"), 2);
    EXPECT_EQ(server_.requests().back().authorization, "Bearer tok-2");
}

TEST_F(TwitterTokenTest, OtherSearchErrorsKeepToken) {
    source_.search(query_);
    server_.setReply("/search", 429, R"({"errors":[{"code":88,"message":"Rate limit exceeded"}]})");
    try {
        source_.search(query_);
        FAIL() << "expected SourceError";
    } catch (const SourceError& e) {
        EXPECT_EQ(e.httpStatus(), 429);
    }
    EXPECT_TRUE(source_.hasToken());
    EXPECT_EQ(server_.hits("/oauth2/token"), 1);
}

TEST_F(TwitterTokenTest, RejectedCredentialsAreSourceError) {
    server_.setReply("/oauth2/token", 403, R"({"errors":[{"code":99,"message":"Unable to verify your credentials"}]})");
    try {
        source_.search(query_);
        FAIL() << "expected SourceError";
    } catch (const SourceError& e) {
        EXPECT_EQ(e.httpStatus(), 403);
    }
    EXPECT_FALSE(source_.hasToken());
    EXPECT_EQ(server_.hits("/search"), 0);
}

}  // namespace test
}  // namespace heatcast
