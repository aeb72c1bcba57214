#include <curl/curl.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "core/types/report_json.hpp"
#include "engine/auditor/auditor.hpp"
#include "engine/batch/batch_auditor.hpp"

namespace {

using namespace Sightline;

void configure_logging(const Core::Config& config) {
    if (config.verbose)
        Core::Logger::set_level(Core::LOG_ALL);
    else if (config.quiet)
        Core::Logger::set_level(Core::LOG_ERROR);
}

Engine::AuditOptions to_audit_options(const Core::Config& config) {
    Engine::AuditOptions options;
    options.max_pages       = config.max_pages;
    options.timeout         = std::chrono::seconds(config.timeout_seconds);
    options.bots            = config.bots;
    options.crawl_delay     = config.crawl_delay;
    options.deadline        = std::chrono::seconds(config.deadline_seconds);
    options.strip_selectors = config.strip_selectors;
    options.backend         = config.backend;
    options.user_agent      = config.user_agent;
    return options;
}

nlohmann::json run_audits(const Core::Config& config) {
    Engine::Auditor auditor(to_audit_options(config));

    if (config.urls.size() == 1) {
        const auto& url = config.urls.front();
        if (config.single)
            return auditor.audit_url(url);
        return auditor.audit_site(url);
    }

    Engine::BatchAuditor batch(auditor, config.concurrency);
    if (config.single)
        return batch.audit_urls(config.urls);
    return batch.audit_sites(config.urls);
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Core::Logger::error(e.what());
        return 1;
    }

    configure_logging(config);
    if (config.urls.empty()) {
        Core::Logger::error("No URLs provided.");
        return 1;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    int status = 0;
    try {
        std::cout << run_audits(config).dump(2) << std::endl;
    } catch (const std::exception& e) {
        Core::Logger::error(std::string("Audit aborted: ") + e.what());
        status = 1;
    }
    curl_global_cleanup();
    return status;
}
