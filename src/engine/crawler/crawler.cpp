#include "crawler.hpp"
#include "../../core/logger/logger.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;

Crawler::Run::Run(Fetch::Fetcher& f, VisitStream& s)
    : fetcher(f), stream(s), tracker(1, [this]() {
          if (!stream.close())
              Logger::warn("Crawler: Stream was closed before the run finished");
          CrawlStats st = snapshot();
          Logger::success("Crawl complete: " + std::to_string(st.visited) + " visited, "
                          + std::to_string(st.failed) + " failed, " + std::to_string(st.pruned)
                          + " pruned.");
      }) {
}

bool Crawler::Run::active() const {
    return tracker.outstanding() > 0;
}

bool Crawler::Run::claim(const std::string& key, int depth) {
    std::lock_guard<std::mutex> lock(visited_mutex);
    auto [it, inserted] = expanded.try_emplace(key, depth);
    if (inserted)
        return true;
    if (it->second >= depth)
        return false;
    it->second = depth;
    return true;
}

bool Crawler::Run::first_emit(const std::string& key) {
    std::lock_guard<std::mutex> lock(visited_mutex);
    return emitted.insert(key).second;
}

CrawlStats Crawler::Run::snapshot() const {
    CrawlStats st;
    st.visited   = visited.load();
    st.failed    = failed.load();
    st.pruned    = pruned.load();
    st.skipped   = skipped.load();
    st.cancelled = cancelled.load();
    st.spawned   = spawned.load();
    return st;
}

Crawler::Crawler(const CrawlerConfig& config)
    : num_threads_(config.threads > 0 ? config.threads : 1),
      dedup_traversal_(config.dedup_traversal),
      pool_(static_cast<std::size_t>(num_threads_)) {
}

Crawler::~Crawler() {
    shutdown();
}

}  // namespace Engine
}  // namespace Arachne
