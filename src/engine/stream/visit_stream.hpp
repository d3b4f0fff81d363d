#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace Arachne {
namespace Engine {

// Multi-producer channel of visited keys. With a non-zero capacity, push()
// blocks while the buffer is full. Items pushed before close() stay readable.
class VisitStream {
public:
    explicit VisitStream(size_t capacity = 0);

    VisitStream(const VisitStream&)            = delete;
    VisitStream& operator=(const VisitStream&) = delete;

    // Returns false if the stream was already closed; the key is dropped.
    bool push(std::string key);

    // Blocks until a key is available; nullopt once closed and drained.
    std::optional<std::string> pop();

    // Returns true only for the call that actually closed the stream.
    bool close();

    bool   closed() const;
    size_t size() const;
    size_t capacity() const {
        return capacity_;
    }

private:
    const size_t capacity_;

    mutable std::mutex      mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::string> buffer_;
    bool                    closed_ = false;
};

}  // namespace Engine
}  // namespace Arachne
