#include "result_cache.hpp"
#include "../core/logger/logger.hpp"

namespace Arachne {
namespace Cache {

using Arachne::Core::Logger;

ResultCache::ResultCache(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout) {
}

std::shared_ptr<ResultCache::Entry> ResultCache::entry_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto&                       entry = entries_[key];
    if (!entry)
        entry = std::make_shared<Entry>();
    return entry;
}

bool ResultCache::acquire(Entry& entry) const {
    if (lock_timeout_.count() <= 0) {
        entry.mutex.lock();
        return true;
    }
    return entry.mutex.try_lock_for(lock_timeout_);
}

FetchResponse ResultCache::get_or_fetch(const std::string& key, Fetch::Fetcher& upstream) {
    auto entry = entry_for(key);

    if (!acquire(*entry)) {
        Logger::warn("Cache contention: " + key);
        return FetchResponse::failure(Fetch::ErrorType::CacheContention,
                                      "timed out waiting for cache entry: " + key);
    }
    std::unique_lock<std::timed_mutex> guard(entry->mutex, std::adopt_lock);

    if (entry->result) {
        hits_++;
        Logger::info("Cache hit: " + key);
        return FetchResponse::ok(entry->result);
    }

    misses_++;
    Logger::info("Cache miss: " + key);

    fetches_++;
    FetchResponse response;
    try {
        response = upstream.fetch(key);
    } catch (...) {
        failures_++;
        throw;
    }
    if (response.success && response.result) {
        entry->result = response.result;
        stored_++;
    }
    else {
        failures_++;
    }
    return response;
}

std::shared_ptr<const FetchResult> ResultCache::lookup(const std::string& key) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = entries_.find(key);
        if (it == entries_.end())
            return nullptr;
        entry = it->second;
    }
    if (!acquire(*entry)) {
        Logger::warn("Cache contention on lookup: " + key);
        return nullptr;
    }
    std::lock_guard<std::timed_mutex> guard(entry->mutex, std::adopt_lock);
    return entry->result;
}

size_t ResultCache::size() const {
    return stored_.load();
}

CacheStats ResultCache::stats() const {
    CacheStats s;
    s.hits     = hits_.load();
    s.misses   = misses_.load();
    s.fetches  = fetches_.load();
    s.failures = failures_.load();
    s.entries  = size();
    return s;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    stored_ = 0;
}

}  // namespace Cache
}  // namespace Arachne
