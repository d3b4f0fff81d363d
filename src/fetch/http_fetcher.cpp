#include "http_fetcher.hpp"
#include <utility>
#include "../utils/text/link_extractor.hpp"

namespace Arachne {
namespace Fetch {

namespace {
constexpr long HTTP_OK_MIN    = 200;
constexpr long HTTP_OK_MAX    = 299;
constexpr long HTTP_NOT_FOUND = 404;
}  // namespace

HttpFetcher::HttpFetcher(HttpFetcherConfig config) : config_(std::move(config)) {
}

size_t HttpFetcher::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    if (!body)
        return 0;

    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

void HttpFetcher::setup_curl_options(CURL* curl, const std::string& url, std::string& body) const {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config_.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    if (!config_.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
}

FetchResponse HttpFetcher::fetch(const std::string& key) {
    // Easy handles are not shareable between threads; one per call.
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        return FetchResponse::failure(ErrorType::Transport, "Failed to initialize CURL handle");

    std::string body;
    setup_curl_options(curl.get(), key, body);

    CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK)
        return FetchResponse::failure(ErrorType::Transport, curl_easy_strerror(code));

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);

    char* effective = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective);
    std::string base_url = effective ? std::string(effective) : key;

    if (status_code == HTTP_NOT_FOUND)
        return FetchResponse::failure(ErrorType::NotFound, "not found: " + key);
    // Unfollowed redirects land here too.
    if (status_code < HTTP_OK_MIN || status_code > HTTP_OK_MAX)
        return FetchResponse::failure(ErrorType::Transport, "HTTP " + std::to_string(status_code));

    auto result     = std::make_shared<FetchResult>();
    result->links   = Utils::Text::LinkExtractor::extract_resolved(base_url, body);
    result->content = std::move(body);
    return FetchResponse::ok(std::move(result));
}

}  // namespace Fetch
}  // namespace Arachne
