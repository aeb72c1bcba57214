#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Sightline {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    int                      max_pages        = Constants::DEFAULT_MAX_PAGES;
    int                      timeout_seconds  = Constants::REQUEST_TIMEOUT_SECONDS;
    double                   crawl_delay      = Constants::DEFAULT_CRAWL_DELAY_SECONDS;
    int                      deadline_seconds = Constants::SITE_AUDIT_DEADLINE_SECONDS;
    int                      concurrency      = Constants::DEFAULT_BATCH_CONCURRENCY;
    std::vector<std::string> bots;
    std::vector<std::string> strip_selectors = default_strip_selectors();
    std::string              backend         = "beast";  // beast | curl
    std::string              user_agent      = Constants::USER_AGENT;
    std::string              config_path;
    bool                     single  = false;
    bool                     verbose = false;
    bool                     quiet   = false;

    static Config parse(int argc, char* argv[]);
};

// Applies a YAML file on top of `config`. Throws std::runtime_error on malformed input.
void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Sightline
