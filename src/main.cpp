#include <curl/curl.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "cache/caching_fetcher.hpp"
#include "cache/result_cache.hpp"
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/crawler.hpp"
#include "engine/stream/visit_stream.hpp"
#include "fetch/http_fetcher.hpp"
#include "fetch/static_fetcher.hpp"

using namespace Arachne;

namespace {

std::unique_ptr<Fetch::Fetcher> make_fetcher(const Core::Config& config) {
    if (config.use_http) {
        Fetch::HttpFetcherConfig http;
        http.user_agent      = config.user_agent;
        http.timeout_seconds = config.timeout_seconds;
        return std::make_unique<Fetch::HttpFetcher>(http);
    }

    auto fetcher = std::make_unique<Fetch::StaticFetcher>(
        Fetch::StaticFetcher::from_yaml(config.dataset_path));
    Core::Logger::info("Loaded " + std::to_string(fetcher->size()) + " pages from "
                       + config.dataset_path);
    return fetcher;
}

void run_crawler(const Core::Config& config) {
    auto               inner = make_fetcher(config);
    Cache::ResultCache cache(std::chrono::milliseconds(config.lock_timeout_ms));
    Cache::CachingFetcher fetcher(*inner, cache);

    Engine::CrawlerConfig crawler_config;
    crawler_config.threads         = config.threads;
    crawler_config.dedup_traversal = config.dedup_traversal;

    Engine::Crawler crawler(crawler_config);

    for (const auto& url : config.urls) {
        Engine::VisitStream stream(config.stream_capacity);
        crawler.crawl(url, config.depth, fetcher, stream);

        while (auto key = stream.pop()) {
            std::cout << "Visited: " << *key << std::endl;
        }
        crawler.wait();

        auto st = crawler.stats();
        std::cout << "Summary: root=" << url << " visited=" << st.visited
                  << " failed=" << st.failed << " pruned=" << st.pruned
                  << " skipped=" << st.skipped << std::endl;
    }

    auto cs = cache.stats();
    std::cout << "Cache: entries=" << cs.entries << " hits=" << cs.hits
              << " misses=" << cs.misses << " fetches=" << cs.fetches << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
        config.validate();
        Core::Logger::set_level(Core::Logger::parse_level(config.log_level));
    } catch (const std::runtime_error& e) {
        Core::Logger::error(e.what());
        return 1;
    }

    if (config.use_http)
        curl_global_init(CURL_GLOBAL_ALL);

    int status = 0;
    try {
        run_crawler(config);
    } catch (const std::runtime_error& e) {
        Core::Logger::error(e.what());
        status = 1;
    }

    if (config.use_http)
        curl_global_cleanup();

    return status;
}
