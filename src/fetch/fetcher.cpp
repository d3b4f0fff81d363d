#include "fetcher.hpp"
#include <utility>

namespace Arachne {

FetchResponse FetchResponse::ok(std::shared_ptr<const FetchResult> result) {
    FetchResponse r;
    r.result  = std::move(result);
    r.success = true;
    return r;
}

FetchResponse FetchResponse::failure(Fetch::ErrorType type, std::string message) {
    FetchResponse r;
    r.success    = false;
    r.error_type = type;
    r.error      = std::move(message);
    return r;
}

namespace Fetch {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::NotFound: return "NotFound";
        case ErrorType::Transport: return "Transport";
        case ErrorType::CacheContention: return "CacheContention";
    }
    return "Unknown";
}

}  // namespace Fetch
}  // namespace Arachne
