#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "../logger/logger.hpp"

namespace Arachne {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["dataset"])
            config.dataset_path = yaml["dataset"].as<std::string>();
        if (yaml["http"])
            config.use_http = yaml["http"].as<bool>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["timeout"])
            config.timeout_seconds = yaml["timeout"].as<int>();
        if (yaml["buffer"])
            config.stream_capacity = yaml["buffer"].as<size_t>();
        if (yaml["lock_timeout"])
            config.lock_timeout_ms = yaml["lock_timeout"].as<int>();
        if (yaml["dedup_traversal"])
            config.dedup_traversal = yaml["dedup_traversal"].as<bool>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Arachne - Bounded-depth concurrent graph crawler"};

    app.add_option("-d,--depth", config.depth, "Maximum crawl depth");
    app.add_option("-t,--threads", config.threads, "Number of crawler threads");
    app.add_option("--dataset", config.dataset_path, "YAML dataset served by the static fetcher");
    app.add_option("--user-agent", config.user_agent, "User agent for HTTP fetches");
    app.add_option("--timeout", config.timeout_seconds, "HTTP request timeout in seconds");
    app.add_option("--buffer", config.stream_capacity, "Output stream capacity (0 = unbounded)");
    app.add_option("--lock-timeout", config.lock_timeout_ms, "Cache lock timeout in ms (0 = none)");
    app.add_option("--log-level", config.log_level, "none, error, warn, info or all");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.set_version_flag("-V,--version", Constants::VERSION);

    app.add_flag("--http", config.use_http, "Fetch pages over HTTP");
    app.add_flag("--dedup-traversal", config.dedup_traversal, "Expand each key at most once per run");

    app.add_option("urls", config.urls, "Root keys to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

void Config::validate() const {
    if (urls.empty())
        throw std::runtime_error("No URLs provided.");
    if (depth < 0)
        throw std::runtime_error("Depth must be non-negative, got " + std::to_string(depth));
    if (threads < 1)
        throw std::runtime_error("Threads must be positive, got " + std::to_string(threads));
    if (lock_timeout_ms < 0)
        throw std::runtime_error("Lock timeout must be non-negative");
    if (use_http == !dataset_path.empty())
        throw std::runtime_error("Specify exactly one of --dataset or --http.");

    try {
        Logger::parse_level(log_level);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }
}

}  // namespace Core
}  // namespace Arachne
