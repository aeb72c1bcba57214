#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Sightline {
namespace Core {

namespace {

std::vector<std::string> as_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node)
            out.push_back(item.as<std::string>());
    }
    else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

void validate(const Config& config) {
    if (config.max_pages < 1)
        throw std::runtime_error("max_pages must be at least 1");
    if (config.timeout_seconds < 1)
        throw std::runtime_error("timeout must be at least 1 second");
    if (config.deadline_seconds < 1)
        throw std::runtime_error("deadline must be at least 1 second");
    if (config.crawl_delay < 0)
        throw std::runtime_error("delay must not be negative");
    if (config.concurrency < 1)
        throw std::runtime_error("concurrency must be at least 1");
    if (config.backend != "beast" && config.backend != "curl")
        throw std::runtime_error("Unknown HTTP backend: " + config.backend);
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["urls"])
            config.urls = as_string_list(yaml["urls"]);
        if (yaml["max_pages"])
            config.max_pages = yaml["max_pages"].as<int>();
        if (yaml["timeout"])
            config.timeout_seconds = yaml["timeout"].as<int>();
        if (yaml["delay"])
            config.crawl_delay = yaml["delay"].as<double>();
        if (yaml["deadline"])
            config.deadline_seconds = yaml["deadline"].as<int>();
        if (yaml["concurrency"])
            config.concurrency = yaml["concurrency"].as<int>();
        if (yaml["bots"])
            config.bots = as_string_list(yaml["bots"]);
        if (yaml["strip_selectors"])
            config.strip_selectors = as_string_list(yaml["strip_selectors"]);
        if (yaml["backend"])
            config.backend = yaml["backend"].as<std::string>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["single"])
            config.single = yaml["single"].as<bool>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Sightline - AI readiness audit for websites"};

    app.add_option("urls", config.urls, "URLs to audit");
    app.add_option("-p,--max-pages", config.max_pages, "Page budget for multi-page audits");
    app.add_option("-t,--timeout", config.timeout_seconds, "Per-request timeout in seconds");
    app.add_option("-d,--delay", config.crawl_delay, "Delay between page requests in seconds");
    app.add_option("--deadline", config.deadline_seconds, "Overall audit deadline in seconds");
    app.add_option("-c,--concurrency", config.concurrency, "Sites audited at once");
    app.add_option("--bots", config.bots, "AI agent names to check in robots.txt");
    app.add_option("--backend", config.backend, "HTTP backend (beast|curl)");
    app.add_option("--user-agent", config.user_agent, "User-Agent header for requests");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("--single", config.single, "Audit only the given page");
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", config.quiet, "Only log errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // CLI flags win over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    validate(config);
    return config;
}

}  // namespace Core
}  // namespace Sightline
