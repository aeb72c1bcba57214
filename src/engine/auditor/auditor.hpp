#pragma once
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../core/types/report.hpp"
#include "../../network/http/http_client.hpp"
#include "../../utils/text/extractor.hpp"

namespace Sightline {
namespace Engine {

using namespace Sightline::Core;
using namespace Sightline::Network::Http;

struct AuditOptions {
    int                      max_pages   = Constants::DEFAULT_MAX_PAGES;
    std::chrono::seconds     timeout     = std::chrono::seconds(Constants::REQUEST_TIMEOUT_SECONDS);
    std::vector<std::string> bots;  // empty: default AI agent list
    double                   crawl_delay = Constants::DEFAULT_CRAWL_DELAY_SECONDS;
    std::chrono::seconds     deadline = std::chrono::seconds(Constants::SITE_AUDIT_DEADLINE_SECONDS);
    std::vector<std::string> strip_selectors = default_strip_selectors();
    std::string              backend         = "beast";
    std::string              user_agent      = Constants::USER_AGENT;
    std::optional<std::uint32_t> shuffle_seed;  // fixed seed makes page sampling reproducible
};

enum class AuditState { Init, SiteWideChecks, Discovery, BatchCrawl, PerPageScoring, Aggregation, Done };

using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

// Runs one audit per call on a private io_context bounded by the deadline.
// Safe to call from several threads at once.
class Auditor {
public:
    explicit Auditor(AuditOptions options, ClientFactory factory = {});

    SiteAuditReport audit_site(const std::string& url) const;
    AuditReport     audit_url(const std::string& url) const;

    static SiteAuditReport timeout_report(const std::string& url, std::chrono::seconds deadline);
    static AuditReport     timeout_page_report(const std::string& url, std::chrono::seconds deadline);
    static const char*     state_name(AuditState state);

    const AuditOptions& options() const {
        return options_;
    }

private:
    struct SiteWideResult {
        RobotsReport               robots;
        std::optional<std::string> raw_robots;
        ContextFileReport          context_file;
        std::optional<CrawlResult> seed;
        std::string                seed_error;  // set when the seed task itself threw
        std::vector<std::string>   errors;
    };

    AuditOptions           options_;
    ClientFactory          factory_;
    Utils::Text::Extractor extractor_;

    void enter(AuditState state, const std::string& url) const;

    boost::asio::awaitable<SiteWideResult> run_site_wide_checks(HttpClient&        client,
                                                                const std::string& url) const;
    boost::asio::awaitable<SiteAuditReport> run_site_pipeline(HttpClient& client,
                                                              std::string url) const;
    boost::asio::awaitable<AuditReport> run_page_pipeline(HttpClient& client, std::string url) const;

    std::chrono::milliseconds stagger_delay(const std::optional<std::string>& raw_robots) const;

    static PageScore score_page(const CrawlResult& crawl);
    static PageScore failed_page(const std::string& url, const std::string& error);
};

std::string domain_of(const std::string& url);

}  // namespace Engine
}  // namespace Sightline
