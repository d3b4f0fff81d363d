#pragma once

#include <memory>
#include <string>
#include <vector>

namespace Arachne {
namespace Fetch {

enum class ErrorType { None, NotFound, Transport, CacheContention };

const char* to_string(ErrorType type);

}  // namespace Fetch
}  // namespace Arachne

namespace Arachne {

// Immutable once produced; shared read-only between crawl branches.
struct FetchResult {
    std::string              content;
    std::vector<std::string> links;
};

struct FetchResponse {
    std::shared_ptr<const FetchResult> result;
    std::string                        error;
    bool                               success    = false;
    Fetch::ErrorType                   error_type = Fetch::ErrorType::None;

    static FetchResponse ok(std::shared_ptr<const FetchResult> result);
    static FetchResponse failure(Fetch::ErrorType type, std::string message);
};

namespace Fetch {

class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Must be safe to call from several threads at once.
    virtual FetchResponse fetch(const std::string& key) = 0;
};

}  // namespace Fetch
}  // namespace Arachne
