#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Arachne {
namespace Core {

struct Config {
    int                      depth   = Constants::DEFAULT_DEPTH;
    int                      threads = Constants::DEFAULT_THREADS;
    std::vector<std::string> urls;
    std::string              dataset_path;
    bool                     use_http        = false;
    std::string              user_agent      = Constants::USER_AGENT;
    int                      timeout_seconds = Constants::REQUEST_TIMEOUT_SECONDS;
    size_t                   stream_capacity = Constants::DEFAULT_STREAM_CAPACITY;
    int                      lock_timeout_ms = Constants::DEFAULT_LOCK_TIMEOUT_MS;
    bool                     dedup_traversal = false;
    std::string              log_level       = "all";
    std::string              config_path;

    static Config parse(int argc, char* argv[]);

    // Throws std::runtime_error describing the first inconsistent setting.
    void validate() const;
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Arachne
