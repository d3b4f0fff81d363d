#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "fetcher.hpp"
#include "../core/types/constants.hpp"

namespace Arachne {
namespace Fetch {

struct HttpFetcherConfig {
    std::string user_agent      = Core::Constants::USER_AGENT;
    long        timeout_seconds = Core::Constants::REQUEST_TIMEOUT_SECONDS;
    bool        follow_location = true;
};

// Fetches pages with libcurl and extracts <a href> links from the body.
// curl_global_init() must have been called before the first fetch.
class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(HttpFetcherConfig config = {});
    ~HttpFetcher() override = default;

    HttpFetcher(const HttpFetcher&)            = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    FetchResponse fetch(const std::string& key) override;

private:
    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    HttpFetcherConfig config_;

    void setup_curl_options(CURL* curl, const std::string& url, std::string& body) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace Fetch
}  // namespace Arachne
