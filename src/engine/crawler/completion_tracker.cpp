#include "completion_tracker.hpp"
#include <utility>

namespace Arachne {
namespace Engine {

CompletionTracker::CompletionTracker(size_t initial, std::function<void()> on_drained)
    : outstanding_(initial), on_drained_(std::move(on_drained)) {
    if (initial == 0)
        finish();
}

void CompletionTracker::add(size_t count) {
    outstanding_.fetch_add(count, std::memory_order_relaxed);
}

void CompletionTracker::done() {
    if (outstanding_.fetch_sub(1, std::memory_order_acq_rel) == 1)
        finish();
}

void CompletionTracker::finish() {
    if (on_drained_)
        on_drained_();
    {
        std::lock_guard<std::mutex> lock(drained_mutex_);
        drained_ = true;
    }
    drained_cv_.notify_all();
}

size_t CompletionTracker::outstanding() const {
    return outstanding_.load(std::memory_order_acquire);
}

bool CompletionTracker::drained() const {
    std::lock_guard<std::mutex> lock(drained_mutex_);
    return drained_;
}

void CompletionTracker::wait() {
    std::unique_lock<std::mutex> lock(drained_mutex_);
    drained_cv_.wait(lock, [this] { return drained_; });
}

}  // namespace Engine
}  // namespace Arachne
