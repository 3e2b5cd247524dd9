#pragma once

#include "user_data_policy.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace EnclosureCache
{

struct RepositoryConfig
{
    std::string cache_directory = "./enclosures";
    uint32_t removal_budget = 16; // Files removed per sweep at most
    uint32_t stale_after_hours = 72; // Grace period protecting recently used files
    size_t max_preloads_per_run = 64;
    std::string representative_url = "https://apple.com";
    size_t worker_threads = 4;
    size_t transfer_threads = 2;
};

struct ReachabilityConfig
{
    std::vector<std::string> constrained_interface_prefixes{ "wwan", "rmnet", "ppp" };
    uint32_t watch_interval_ms = 2000;
};

struct MetricsConfig
{
    bool enabled = false;
    std::string bind_address = "127.0.0.1";
    int port = 8080;
    std::string endpoint_path = "/metrics";
};

struct LoggingConfig
{
    std::string level = "info";
    std::string output = "console";
    std::string file = "enclosure-cache.log";
    std::string categories = "all";
};

struct Config
{
    UserDataPolicy settings;
    RepositoryConfig repository;
    ReachabilityConfig reachability;
    MetricsConfig metrics;
    LoggingConfig logging;
};

} // namespace EnclosureCache
