#include <stdexcept>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;

void Crawler::crawl(const std::string& root,
                    int                max_depth,
                    Fetch::Fetcher&    fetcher,
                    VisitStream&       stream) {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (is_shutdown_)
        throw std::logic_error("Crawler: already shut down");
    if (run_ && run_->active())
        throw std::logic_error("Crawler: a crawl is already running");

    run_ = std::make_shared<Run>(fetcher, stream);

    Logger::info("Crawler: Starting for " + root + " (Depth " + std::to_string(max_depth) + ", "
                 + std::to_string(num_threads_) + " threads)");

    // Posted under run_mutex_ so shutdown() cannot join the pool in between.
    // The root's count was taken by the tracker's initial value.
    post_task(run_, root, max_depth);
}

std::shared_ptr<Crawler::Run> Crawler::current_run() const {
    std::lock_guard<std::mutex> lock(run_mutex_);
    return run_;
}

void Crawler::wait() {
    if (auto run = current_run())
        run->tracker.wait();
}

void Crawler::cancel() {
    auto run = current_run();
    if (run && run->active()) {
        if (!run->cancel_requested.exchange(true))
            Logger::warn("Crawler: Cancellation requested");
    }
}

bool Crawler::running() const {
    auto run = current_run();
    return run && run->active();
}

CrawlStats Crawler::stats() const {
    auto run = current_run();
    return run ? run->snapshot() : CrawlStats{};
}

void Crawler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (is_shutdown_)
            return;
        is_shutdown_ = true;
    }

    cancel();
    wait();
    pool_.join();
}

}  // namespace Engine
}  // namespace Arachne
