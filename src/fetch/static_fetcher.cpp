#include "static_fetcher.hpp"
#include <stdexcept>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace Arachne {
namespace Fetch {

namespace {

StaticFetcher load_pages(const YAML::Node& root) {
    YAML::Node pages = root["pages"];
    if (!pages || !pages.IsMap())
        throw std::runtime_error("Dataset has no 'pages' map");

    StaticFetcher fetcher;
    for (auto it = pages.begin(); it != pages.end(); ++it) {
        const YAML::Node& page = it->second;

        std::string              body;
        std::vector<std::string> links;
        if (page["body"])
            body = page["body"].as<std::string>();
        if (page["links"] && page["links"].IsSequence()) {
            for (const auto& link : page["links"])
                links.push_back(link.as<std::string>());
        }
        fetcher.add(it->first.as<std::string>(), std::move(body), std::move(links));
    }
    return fetcher;
}

}  // namespace

StaticFetcher StaticFetcher::from_yaml(const std::string& path) {
    try {
        return load_pages(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing dataset " + path + ": " + std::string(e.what()));
    }
}

StaticFetcher StaticFetcher::from_yaml_string(const std::string& text) {
    try {
        return load_pages(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing dataset: " + std::string(e.what()));
    }
}

void StaticFetcher::add(const std::string& key, std::string content, std::vector<std::string> links) {
    auto result     = std::make_shared<FetchResult>();
    result->content = std::move(content);
    result->links   = std::move(links);
    pages_[key]     = std::move(result);
}

bool StaticFetcher::contains(const std::string& key) const {
    return pages_.count(key) > 0;
}

size_t StaticFetcher::size() const {
    return pages_.size();
}

FetchResponse StaticFetcher::fetch(const std::string& key) {
    auto it = pages_.find(key);
    if (it == pages_.end())
        return FetchResponse::failure(ErrorType::NotFound, "not found: " + key);
    return FetchResponse::ok(it->second);
}

}  // namespace Fetch
}  // namespace Arachne
