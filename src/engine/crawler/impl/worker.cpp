#include <boost/asio/post.hpp>
#include <exception>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;

void Crawler::post_task(std::shared_ptr<Run> run, std::string key, int depth) {
    boost::asio::post(pool_, [this, run = std::move(run), key = std::move(key), depth]() {
        try {
            visit(run, key, depth);
        } catch (const std::exception& e) {
            Logger::error("Task failed for " + key + ": " + std::string(e.what()));
        }
    });
}

void Crawler::spawn(const std::shared_ptr<Run>& run, const std::string& key, int depth) {
    // Registered before the parent's own count is released.
    run->tracker.add();
    run->spawned++;
    post_task(run, key, depth);
}

void Crawler::visit(const std::shared_ptr<Run>& run, const std::string& key, int depth) {
    TaskGuard guard(run->tracker);

    if (depth <= 0) {
        run->pruned++;
        return;
    }

    if (run->cancel_requested) {
        run->cancelled++;
        return;
    }

    if (dedup_traversal_ && !run->claim(key, depth)) {
        run->skipped++;
        return;
    }

    Logger::info("Fetching: " + key + " (Depth " + std::to_string(depth) + ")");

    FetchResponse res;
    try {
        res = run->fetcher.fetch(key);
    } catch (const std::exception& e) {
        res = FetchResponse::failure(Fetch::ErrorType::Transport, e.what());
    }

    if (!res.success || !res.result) {
        run->failed++;
        Logger::error("Failed: " + key + " [" + Fetch::to_string(res.error_type) + "] "
                      + res.error);
        return;
    }

    Logger::success("Found: " + key + " (" + std::to_string(res.result->links.size())
                    + " links)");

    if (!dedup_traversal_ || run->first_emit(key)) {
        if (run->stream.push(key))
            run->visited++;
        else
            Logger::warn("Stream closed, dropped: " + key);
    }

    for (const auto& link : res.result->links) {
        spawn(run, link, depth - 1);
    }
}

}  // namespace Engine
}  // namespace Arachne
