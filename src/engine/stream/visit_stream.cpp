#include "visit_stream.hpp"
#include <utility>

namespace Arachne {
namespace Engine {

VisitStream::VisitStream(size_t capacity) : capacity_(capacity) {
}

bool VisitStream::push(std::string key) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || capacity_ == 0 || buffer_.size() < capacity_;
        });
        if (closed_)
            return false;
        buffer_.push_back(std::move(key));
    }
    not_empty_.notify_one();
    return true;
}

std::optional<std::string> VisitStream::pop() {
    std::string key;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
        if (buffer_.empty())
            return std::nullopt;
        key = std::move(buffer_.front());
        buffer_.pop_front();
    }
    not_full_.notify_one();
    return key;
}

// Notifies under the lock: once a reader observes closed_ the stream may be
// destroyed, so the closing thread must be done with it by then.
bool VisitStream::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        return false;
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
    return true;
}

bool VisitStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t VisitStream::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

}  // namespace Engine
}  // namespace Arachne
