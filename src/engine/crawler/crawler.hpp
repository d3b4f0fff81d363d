#pragma once
#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "../../fetch/fetcher.hpp"
#include "../stream/visit_stream.hpp"
#include "completion_tracker.hpp"

namespace Arachne {
namespace Engine {

struct CrawlerConfig {
    int  threads         = 1;
    bool dedup_traversal = false;
};

struct CrawlStats {
    size_t visited   = 0;
    size_t failed    = 0;
    size_t pruned    = 0;
    size_t skipped   = 0;
    size_t cancelled = 0;
    size_t spawned   = 0;
};

// Depth-bounded recursive crawl. Every visited key spawns one pool task per
// outbound link with one less unit of depth; the stream is closed when the
// last task of the run finishes.
class Crawler {
public:
    explicit Crawler(const CrawlerConfig& config);
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    // Starts a run and returns immediately. fetcher and stream must outlive
    // the run; the caller drains stream until pop() yields nullopt, after
    // which the stream may be released and another crawl started.
    void crawl(const std::string& root, int max_depth, Fetch::Fetcher& fetcher, VisitStream& stream);

    void       wait();
    void       cancel();
    bool       running() const;
    CrawlStats stats() const;
    void       shutdown();

private:
    struct Run {
        Run(Fetch::Fetcher& f, VisitStream& s);

        Fetch::Fetcher&   fetcher;
        VisitStream&      stream;
        CompletionTracker tracker;

        std::atomic<bool>   cancel_requested{false};
        std::atomic<size_t> visited{0};
        std::atomic<size_t> failed{0};
        std::atomic<size_t> pruned{0};
        std::atomic<size_t> skipped{0};
        std::atomic<size_t> cancelled{0};
        std::atomic<size_t> spawned{0};

        // Traversal dedup: largest budget each key was expanded with.
        std::mutex                           visited_mutex;
        std::unordered_map<std::string, int> expanded;
        std::unordered_set<std::string>      emitted;

        // False from the moment the last task finishes, before the stream
        // is closed, so a consumer that saw the close may start a new run.
        bool       active() const;
        bool       claim(const std::string& key, int depth);
        bool       first_emit(const std::string& key);
        CrawlStats snapshot() const;
    };

    int  num_threads_;
    bool dedup_traversal_;

    boost::asio::thread_pool pool_;

    mutable std::mutex   run_mutex_;
    std::shared_ptr<Run> run_;
    bool                 is_shutdown_ = false;

    std::shared_ptr<Run> current_run() const;

    void post_task(std::shared_ptr<Run> run, std::string key, int depth);
    void spawn(const std::shared_ptr<Run>& run, const std::string& key, int depth);
    void visit(const std::shared_ptr<Run>& run, const std::string& key, int depth);
};

}  // namespace Engine
}  // namespace Arachne
