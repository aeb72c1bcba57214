#include "page_crawler.hpp"
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/converter.hpp"
#include "../concurrency/task_group.hpp"

namespace Sightline {
namespace Engine {

using namespace Sightline::Core;
using namespace Sightline::Network::Http;
using namespace Sightline::Utils::Text;

PageCrawler::PageCrawler(HttpClient& client, const Extractor& extractor)
    : client_(client), extractor_(extractor) {
}

boost::asio::awaitable<CrawlResult> PageCrawler::crawl_page(const std::string& url) {
    CrawlResult result;
    result.url = url;

    Logger::info("Fetching: " + url);
    Response res       = co_await client_.get(url);
    result.status_code = res.status_code;

    if (!res.success || res.status_code >= 300) {
        result.error = res.error.empty() ? "HTTP " + std::to_string(res.status_code) : res.error;
        Logger::warn("Failed: " + url + " - " + result.error);
        co_return result;
    }

    std::string base = res.effective_url.empty() ? url : res.effective_url;
    result.success        = true;
    result.markdown       = extractor_.to_markdown(res.body);
    result.internal_links = Converter::extract_internal_links(res.body, base);
    result.html           = std::move(res.body);
    Logger::debug("Crawled " + url + ": " + std::to_string(result.internal_links.size())
                  + " internal links");
    co_return result;
}

boost::asio::awaitable<CrawlResult> PageCrawler::crawl_staggered(std::string               url,
                                                                std::chrono::milliseconds wait,
                                                                std::shared_ptr<Limiter>  limiter) {
    if (wait.count() > 0) {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        timer.expires_after(wait);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
    co_await limiter->acquire();
    Limiter::Slot slot(*limiter);
    co_return co_await crawl_page(url);
}

boost::asio::awaitable<std::vector<CrawlResult>>
PageCrawler::crawl_batch(const std::vector<std::string>& urls,
                         std::chrono::milliseconds       delay,
                         size_t                          max_concurrent) {
    std::vector<Outcome<CrawlResult>> outcomes(urls.size());

    auto executor = co_await boost::asio::this_coro::executor;
    // Shared with the children so a frame torn down late never outlives it.
    auto limiter = std::make_shared<Limiter>(executor, max_concurrent);

    TaskGroup group(executor);
    for (size_t i = 0; i < urls.size(); ++i) {
        auto wait = delay * static_cast<long>(i);
        group.spawn(capture(crawl_staggered(urls[i], wait, limiter), outcomes[i]));
    }
    co_await group.wait();

    std::vector<CrawlResult> results;
    results.reserve(urls.size());
    for (size_t i = 0; i < urls.size(); ++i) {
        if (outcomes[i].ok()) {
            results.push_back(std::move(*outcomes[i].value));
            continue;
        }
        CrawlResult failed;
        failed.url   = urls[i];
        failed.error = outcomes[i].error;
        Logger::warn("Crawl task for " + urls[i] + " failed: " + failed.error);
        results.push_back(std::move(failed));
    }
    co_return results;
}

}  // namespace Engine
}  // namespace Sightline
