#include "auditor.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/io_context.hpp>
#include "../../core/logger/logger.hpp"
#include "../../network/http/client_factory.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"
#include "../concurrency/deadline.hpp"

namespace Sightline {
namespace Engine {

namespace {
constexpr const char* TIMED_OUT = "Timed out";
}  // namespace

std::string domain_of(const std::string& url) {
    auto parsed = Utils::Url::parse(url);
    return parsed.port.empty() ? parsed.host : parsed.host + ":" + parsed.port;
}

Auditor::Auditor(AuditOptions options, ClientFactory factory)
    : options_(std::move(options)),
      factory_(std::move(factory)),
      extractor_(options_.strip_selectors) {
    if (!factory_) {
        factory_ = [backend = options_.backend, timeout = options_.timeout, ua = options_.user_agent] {
            return make_client(backend, timeout, ua);
        };
    }
}

const char* Auditor::state_name(AuditState state) {
    switch (state) {
        case AuditState::Init: return "Init";
        case AuditState::SiteWideChecks: return "SiteWideChecks";
        case AuditState::Discovery: return "Discovery";
        case AuditState::BatchCrawl: return "BatchCrawl";
        case AuditState::PerPageScoring: return "PerPageScoring";
        case AuditState::Aggregation: return "Aggregation";
        case AuditState::Done: return "Done";
    }
    return "Unknown";
}

void Auditor::enter(AuditState state, const std::string& url) const {
    Logger::info(std::string("[") + state_name(state) + "] " + url);
}

SiteAuditReport Auditor::timeout_report(const std::string& url, std::chrono::seconds deadline) {
    SiteAuditReport report;
    report.url                     = url;
    report.domain                  = domain_of(url);
    report.robots.summary          = TIMED_OUT;
    report.context_file.summary    = TIMED_OUT;
    report.structured_data.summary = TIMED_OUT;
    report.content.summary         = TIMED_OUT;
    report.discovery.method        = "timeout";
    report.discovery.summary       = TIMED_OUT;
    report.errors.push_back("Audit timed out after " + std::to_string(deadline.count()) + "s");
    return report;
}

AuditReport Auditor::timeout_page_report(const std::string& url, std::chrono::seconds deadline) {
    AuditReport report;
    report.url                     = url;
    report.robots.summary          = TIMED_OUT;
    report.context_file.summary    = TIMED_OUT;
    report.structured_data.summary = TIMED_OUT;
    report.content.summary         = TIMED_OUT;
    report.errors.push_back("Audit timed out after " + std::to_string(deadline.count()) + "s");
    return report;
}

SiteAuditReport Auditor::audit_site(const std::string& url) const {
    enter(AuditState::Init, url);

    // Declared after the context so it is destroyed first; abandoned transfers post to ioc.
    boost::asio::io_context     ioc;
    std::unique_ptr<HttpClient> client = factory_();

    auto report = run_with_deadline(ioc, run_site_pipeline(*client, url), options_.deadline);
    if (!report) {
        Logger::error("Audit of " + url + " timed out after "
                      + std::to_string(options_.deadline.count()) + "s");
        return timeout_report(url, options_.deadline);
    }
    Logger::success("Audited " + url + ": " + Utils::Text::format_decimal(report->overall_score) + "/100");
    return std::move(*report);
}

AuditReport Auditor::audit_url(const std::string& url) const {
    enter(AuditState::Init, url);

    boost::asio::io_context     ioc;
    std::unique_ptr<HttpClient> client = factory_();

    auto report = run_with_deadline(ioc, run_page_pipeline(*client, url), options_.deadline);
    if (!report) {
        Logger::error("Audit of " + url + " timed out after "
                      + std::to_string(options_.deadline.count()) + "s");
        return timeout_page_report(url, options_.deadline);
    }
    Logger::success("Audited " + url + ": " + Utils::Text::format_decimal(report->overall_score) + "/100");
    return std::move(*report);
}

}  // namespace Engine
}  // namespace Sightline
