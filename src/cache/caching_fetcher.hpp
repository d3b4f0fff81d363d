#pragma once
#include "../fetch/fetcher.hpp"
#include "result_cache.hpp"

namespace Arachne {
namespace Cache {

// Presents the Fetcher contract over a ResultCache. Holds no state of its own;
// both referents must outlive it.
class CachingFetcher : public Fetch::Fetcher {
public:
    CachingFetcher(Fetch::Fetcher& inner, ResultCache& cache) : inner_(inner), cache_(cache) {
    }
    ~CachingFetcher() override = default;

    FetchResponse fetch(const std::string& key) override {
        return cache_.get_or_fetch(key, inner_);
    }

private:
    Fetch::Fetcher& inner_;
    ResultCache&    cache_;
};

}  // namespace Cache
}  // namespace Arachne
