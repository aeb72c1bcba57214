#pragma once
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../../core/types/report.hpp"
#include "../../network/http/http_client.hpp"
#include "../../utils/text/extractor.hpp"

namespace Sightline {
namespace Engine {

class Limiter;

// Fetches pages and turns them into CrawlResults (HTML, markdown, internal links).
class PageCrawler {
public:
    PageCrawler(Network::Http::HttpClient& client, const Utils::Text::Extractor& extractor);

    // Never throws for fetch failures; they come back as success == false.
    boost::asio::awaitable<Core::CrawlResult> crawl_page(const std::string& url);

    // One result per input URL, in input order. Task i starts after i * delay
    // and at most `max_concurrent` fetches are in flight.
    boost::asio::awaitable<std::vector<Core::CrawlResult>>
    crawl_batch(const std::vector<std::string>& urls,
                std::chrono::milliseconds       delay,
                size_t max_concurrent = Core::Constants::MAX_CONCURRENT_CRAWLS);

private:
    Network::Http::HttpClient&    client_;
    const Utils::Text::Extractor& extractor_;

    boost::asio::awaitable<Core::CrawlResult> crawl_staggered(std::string               url,
                                                              std::chrono::milliseconds wait,
                                                              std::shared_ptr<Limiter>  limiter);
};

}  // namespace Engine
}  // namespace Sightline
