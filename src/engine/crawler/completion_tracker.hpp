#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace Arachne {
namespace Engine {

// Counts outstanding crawl tasks. The decrement that takes the count to zero
// runs on_drained exactly once and releases wait().
class CompletionTracker {
public:
    CompletionTracker(size_t initial, std::function<void()> on_drained);

    CompletionTracker(const CompletionTracker&)            = delete;
    CompletionTracker& operator=(const CompletionTracker&) = delete;

    // Only valid while the caller still holds one of the outstanding counts.
    void add(size_t count = 1);
    void done();

    size_t outstanding() const;
    bool   drained() const;
    void   wait();

private:
    std::atomic<size_t>   outstanding_;
    std::function<void()> on_drained_;

    mutable std::mutex      drained_mutex_;
    std::condition_variable drained_cv_;
    bool                    drained_ = false;

    void finish();
};

// Signals done() when the owning task leaves scope, whatever the exit path.
struct TaskGuard {
    CompletionTracker& tracker;
    explicit TaskGuard(CompletionTracker& t) : tracker(t) {
    }
    ~TaskGuard() {
        tracker.done();
    }
    TaskGuard(const TaskGuard&)            = delete;
    TaskGuard& operator=(const TaskGuard&) = delete;
};

}  // namespace Engine
}  // namespace Arachne
