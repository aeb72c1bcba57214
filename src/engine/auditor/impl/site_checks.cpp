#include <algorithm>
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/this_coro.hpp>
#include "../../../checks/context_file/context_file_check.hpp"
#include "../../../checks/robots/robots_check.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../utils/robotstxt/robotstxt.hpp"
#include "../../concurrency/task_group.hpp"
#include "../../crawler/page_crawler.hpp"
#include "../auditor.hpp"

namespace Sightline {
namespace Engine {

using namespace Sightline::Checks;

boost::asio::awaitable<Auditor::SiteWideResult>
Auditor::run_site_wide_checks(HttpClient& client, const std::string& url) const {
    enter(AuditState::SiteWideChecks, url);

    PageCrawler crawler(client, extractor_);

    Outcome<RobotsOutcome>     robots;
    Outcome<ContextFileReport> context_file;
    Outcome<CrawlResult>       seed;

    TaskGroup group(co_await boost::asio::this_coro::executor);
    group.spawn(capture(RobotsCheck::run(client, url, options_.bots), robots));
    group.spawn(capture(ContextFileCheck::run(client, url), context_file));
    group.spawn(capture(crawler.crawl_page(url), seed));
    co_await group.wait();

    SiteWideResult result;
    if (robots.ok()) {
        result.robots     = std::move(robots.value->report);
        result.raw_robots = std::move(robots.value->raw);
    }
    else {
        result.robots.summary = "Check failed";
        result.errors.push_back("Robots check failed: " + robots.error);
        Logger::warn(result.errors.back());
    }

    if (context_file.ok()) {
        result.context_file = std::move(*context_file.value);
    }
    else {
        result.context_file.summary = "Check failed";
        result.errors.push_back("llms.txt check failed: " + context_file.error);
        Logger::warn(result.errors.back());
    }

    if (seed.ok()) {
        result.seed = std::move(*seed.value);
    }
    else {
        result.seed_error = seed.error;
        result.errors.push_back("Seed crawl failed: " + seed.error);
        Logger::warn(result.errors.back());
    }
    co_return result;
}

std::chrono::milliseconds Auditor::stagger_delay(const std::optional<std::string>& raw_robots) const {
    double seconds = options_.crawl_delay;
    if (raw_robots) {
        double requested = Utils::RobotsTxt::parse(*raw_robots).get_crawl_delay(options_.user_agent);
        if (requested > seconds) {
            Logger::info("Honouring robots.txt Crawl-delay of " + std::to_string(requested) + "s");
            seconds = requested;
        }
    }
    return std::chrono::milliseconds(static_cast<long>(seconds * 1000.0));
}

}  // namespace Engine
}  // namespace Sightline
