#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "fetcher.hpp"

namespace Arachne {
namespace Fetch {

// Serves a fixed dataset. Populate with add() before sharing across threads;
// fetch() only reads.
class StaticFetcher : public Fetcher {
public:
    StaticFetcher() = default;
    ~StaticFetcher() override = default;

    static StaticFetcher from_yaml(const std::string& path);
    static StaticFetcher from_yaml_string(const std::string& text);

    void add(const std::string& key, std::string content, std::vector<std::string> links);
    bool contains(const std::string& key) const;
    size_t size() const;

    FetchResponse fetch(const std::string& key) override;

private:
    std::map<std::string, std::shared_ptr<const FetchResult>> pages_;
};

}  // namespace Fetch
}  // namespace Arachne
