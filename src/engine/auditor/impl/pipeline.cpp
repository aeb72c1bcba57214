#include <algorithm>
#include <iterator>
#include "../../../checks/content/content_check.hpp"
#include "../../../checks/structured_data/structured_data_check.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../../aggregator/aggregator.hpp"
#include "../../crawler/page_crawler.hpp"
#include "../../discovery/discovery.hpp"
#include "../auditor.hpp"

namespace Sightline {
namespace Engine {

using namespace Sightline::Checks;
using Utils::Text::round1;

namespace {
constexpr const char* CRAWL_FAILED = "Crawl failed";
}  // namespace

PageScore Auditor::score_page(const CrawlResult& crawl) {
    if (!crawl.success)
        return failed_page(crawl.url, crawl.error);

    PageScore page;
    page.url             = crawl.url;
    page.structured_data = StructuredDataCheck::analyze(crawl.html);
    page.content         = ContentCheck::analyze(crawl.markdown);
    return page;
}

PageScore Auditor::failed_page(const std::string& url, const std::string& error) {
    PageScore page;
    page.url                     = url;
    page.structured_data.summary = CRAWL_FAILED;
    page.content.summary         = CRAWL_FAILED;
    page.errors.push_back(error.empty() ? "Unknown crawl error" : error);
    return page;
}

boost::asio::awaitable<SiteAuditReport> Auditor::run_site_pipeline(HttpClient& client,
                                                                   std::string url) const {
    SiteAuditReport report;
    report.url    = url;
    report.domain = domain_of(url);

    SiteWideResult site = co_await run_site_wide_checks(client, url);
    report.robots       = std::move(site.robots);
    report.context_file = std::move(site.context_file);
    report.errors       = std::move(site.errors);

    enter(AuditState::Discovery, url);
    std::vector<std::string> seed_links;
    if (site.seed && site.seed->success)
        seed_links = site.seed->internal_links;

    Discovery discovery(client, options_.max_pages, options_.shuffle_seed);
    try {
        report.discovery = co_await discovery.discover(url, site.raw_robots, seed_links);
    } catch (const std::exception& e) {
        report.errors.push_back(std::string("Discovery failed: ") + e.what());
        Logger::warn(report.errors.back());
        report.discovery.method       = "spider";
        report.discovery.urls_sampled = {url};
        report.discovery.summary      = "method=spider, found=0, sampled=1";
    }

    enter(AuditState::BatchCrawl, url);
    std::vector<std::string> remaining;
    std::copy_if(report.discovery.urls_sampled.begin(),
                 report.discovery.urls_sampled.end(),
                 std::back_inserter(remaining),
                 [&](const std::string& u) { return u != url; });

    PageCrawler              crawler(client, extractor_);
    std::vector<CrawlResult> crawled;
    if (!remaining.empty()) {
        Logger::info("Crawling " + std::to_string(remaining.size()) + " additional pages");
        crawled = co_await crawler.crawl_batch(remaining, stagger_delay(site.raw_robots));
    }

    enter(AuditState::PerPageScoring, url);
    if (site.seed && site.seed->success) {
        report.pages.push_back(score_page(*site.seed));
    }
    else {
        std::string error = site.seed ? site.seed->error : site.seed_error;
        if (site.seed)
            report.errors.push_back("Seed crawl error: " + error);
        report.pages.push_back(failed_page(url, error));
    }
    for (const auto& result : crawled)
        report.pages.push_back(score_page(result));

    report.pages_attempted = static_cast<int>(report.pages.size());
    report.pages_failed    = static_cast<int>(std::count_if(
        report.pages.begin(), report.pages.end(), [](const PageScore& p) { return !p.errors.empty(); }));

    enter(AuditState::Aggregation, url);
    SiteScores scores      = Aggregator::aggregate(report.pages, report.robots, report.context_file);
    report.structured_data = std::move(scores.structured_data);
    report.content         = std::move(scores.content);
    report.overall_score   = scores.overall_score;

    enter(AuditState::Done, url);
    co_return report;
}

boost::asio::awaitable<AuditReport> Auditor::run_page_pipeline(HttpClient& client,
                                                               std::string url) const {
    AuditReport report;
    report.url = url;

    SiteWideResult site = co_await run_site_wide_checks(client, url);
    report.robots       = std::move(site.robots);
    report.context_file = std::move(site.context_file);
    report.errors       = std::move(site.errors);

    enter(AuditState::PerPageScoring, url);
    std::string html;
    std::string markdown;
    if (site.seed && site.seed->success) {
        html     = site.seed->html;
        markdown = site.seed->markdown;
    }
    else if (site.seed) {
        report.errors.push_back("Crawl error: "
                                + (site.seed->error.empty() ? "Unknown crawl error" : site.seed->error));
    }
    report.structured_data = StructuredDataCheck::analyze(html);
    report.content         = ContentCheck::analyze(markdown);
    report.overall_score   = round1(report.robots.score + report.context_file.score
                                  + report.structured_data.score + report.content.score);

    enter(AuditState::Done, url);
    co_return report;
}

}  // namespace Engine
}  // namespace Sightline
