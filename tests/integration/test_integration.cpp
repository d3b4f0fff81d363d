#include <algorithm>
#include <curl/curl.h>
#include <gtest/gtest.h>
#include <httplib.h>
#include <string>
#include <thread>
#include <vector>
#include "cache/caching_fetcher.hpp"
#include "cache/result_cache.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "fetch/http_fetcher.hpp"

using namespace Arachne;

class TestServer {
public:
    void set_route(const std::string& path,
                   const std::string& content,
                   const std::string& type = "text/html") {
        server_.Get(path, [content, type](const httplib::Request&, httplib::Response& res) {
            res.set_content(content, type.c_str());
        });
    }

    void set_status(const std::string& path, int status) {
        server_.Get(path, [status](const httplib::Request&, httplib::Response& res) {
            res.status = status;
        });
    }

    void set_redirect(const std::string& path, const std::string& target) {
        server_.Get(path, [target](const httplib::Request&, httplib::Response& res) {
            res.set_redirect(target);
        });
    }

    void start(const std::string& host = "127.0.0.1") {
        host_   = host;
        port_   = server_.bind_to_any_port(host.c_str());
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
    }

    void stop() {
        server_.stop();
        if (thread_.joinable())
            thread_.join();
    }

    std::string url(const std::string& path = "/") const {
        return "http://" + host_ + ":" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    std::thread     thread_;
    int             port_ = 0;
    std::string     host_ = "127.0.0.1";
};

class IntegrationTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        curl_global_init(CURL_GLOBAL_ALL);
    }
    static void TearDownTestSuite() {
        curl_global_cleanup();
    }

    void SetUp() override {
        Core::Logger::set_level(Core::LOG_ERROR);
        server_.set_route("/", "<html><body><a href='/a'>A</a><a href='b'>B</a></body></html>");
        server_.set_route("/a", "<html><body><a href='/'>Home</a><a href='/b#top'>B</a></body></html>");
        server_.set_route("/b", "<html><body><a href='/missing'>Gone</a></body></html>");
        server_.set_status("/broken", 500);
        server_.set_redirect("/moved", "/a");
        server_.start();
    }

    void TearDown() override {
        server_.stop();
        Core::Logger::set_level(Core::LOG_ALL);
    }

    TestServer server_;
};

TEST_F(IntegrationTest, FetchResolvesLinks) {
    Fetch::HttpFetcher fetcher;
    auto               res = fetcher.fetch(server_.url("/a"));

    ASSERT_TRUE(res.success) << res.error;
    EXPECT_NE(res.result->content.find("Home"), std::string::npos);
    ASSERT_EQ(res.result->links.size(), 2u);
    EXPECT_EQ(res.result->links[0], server_.url("/"));
    EXPECT_EQ(res.result->links[1], server_.url("/b"));
}

TEST_F(IntegrationTest, MissingPageIsNotFound) {
    Fetch::HttpFetcher fetcher;
    auto               res = fetcher.fetch(server_.url("/missing"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, Fetch::ErrorType::NotFound);
}

TEST_F(IntegrationTest, ServerErrorIsTransport) {
    Fetch::HttpFetcher fetcher;
    auto               res = fetcher.fetch(server_.url("/broken"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, Fetch::ErrorType::Transport);
    EXPECT_EQ(res.error, "HTTP 500");
}

TEST_F(IntegrationTest, FollowedRedirectResolvesAgainstTarget) {
    Fetch::HttpFetcher fetcher;
    auto               res = fetcher.fetch(server_.url("/moved"));

    ASSERT_TRUE(res.success) << res.error;
    ASSERT_EQ(res.result->links.size(), 2u);
    EXPECT_EQ(res.result->links[1], server_.url("/b"));
}

TEST_F(IntegrationTest, UnfollowedRedirectIsTransport) {
    Fetch::HttpFetcherConfig config;
    config.follow_location = false;
    Fetch::HttpFetcher fetcher(config);

    auto res = fetcher.fetch(server_.url("/moved"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, Fetch::ErrorType::Transport);
    EXPECT_EQ(res.error, "HTTP 302");
}

TEST_F(IntegrationTest, UnreachableHostIsTransport) {
    Fetch::HttpFetcherConfig config;
    config.timeout_seconds = 2;
    Fetch::HttpFetcher fetcher(config);

    auto res = fetcher.fetch("http://127.0.0.1:1/");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, Fetch::ErrorType::Transport);
}

TEST_F(IntegrationTest, CrawlOverHttp) {
    Fetch::HttpFetcher    http;
    Cache::ResultCache    cache;
    Cache::CachingFetcher fetcher(http, cache);

    Engine::CrawlerConfig config;
    config.threads = 4;
    Engine::Crawler     crawler(config);
    Engine::VisitStream stream;

    crawler.crawl(server_.url("/"), 3, fetcher, stream);

    std::vector<std::string> keys;
    while (auto key = stream.pop())
        keys.push_back(*key);
    crawler.wait();

    EXPECT_NE(std::find(keys.begin(), keys.end(), server_.url("/")), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), server_.url("/a")), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), server_.url("/b")), keys.end());
    EXPECT_EQ(std::find(keys.begin(), keys.end(), server_.url("/missing")), keys.end());

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_GT(crawler.stats().failed, 0u);
}
