#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../fetch/fetcher.hpp"

namespace Arachne {
namespace Cache {

struct CacheStats {
    size_t hits     = 0;
    size_t misses   = 0;
    size_t fetches  = 0;
    size_t failures = 0;
    size_t entries  = 0;
};

// Fetch results keyed by identifier. Each key has its own guard, held across
// the underlying fetch, so a key is fetched by one caller at a time and never
// again once a result is stored. Distinct keys fetch in parallel.
class ResultCache {
public:
    // A zero timeout waits for the key's guard indefinitely.
    explicit ResultCache(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(0));

    ResultCache(const ResultCache&)            = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    FetchResponse get_or_fetch(const std::string& key, Fetch::Fetcher& upstream);

    // Cached result, or nullptr. Never fetches, but waits out an in-flight
    // fetch of the same key for at most the lock timeout; nullptr when the
    // wait times out.
    std::shared_ptr<const FetchResult> lookup(const std::string& key) const;

    size_t     size() const;
    CacheStats stats() const;

    // Not safe while fetches are in flight.
    void clear();

private:
    struct Entry {
        std::timed_mutex                   mutex;
        std::shared_ptr<const FetchResult> result;
    };

    std::shared_ptr<Entry> entry_for(const std::string& key);
    bool                   acquire(Entry& entry) const;

    std::chrono::milliseconds lock_timeout_;

    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> fetches_{0};
    std::atomic<size_t> failures_{0};
    std::atomic<size_t> stored_{0};
};

}  // namespace Cache
}  // namespace Arachne
