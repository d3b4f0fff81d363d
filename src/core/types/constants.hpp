#pragma once
#include <cstddef>

namespace Arachne {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS = 4;
    static constexpr int         DEFAULT_DEPTH   = 4;
    static constexpr const char* VERSION         = "0.1.0";

    static constexpr size_t DEFAULT_STREAM_CAPACITY = 0;  // Unbounded
    static constexpr int    DEFAULT_LOCK_TIMEOUT_MS = 0;  // Wait forever

    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr const char* USER_AGENT              = "Arachne-Crawler/1.0";
};

}  // namespace Core
}  // namespace Arachne
