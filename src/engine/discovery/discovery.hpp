#pragma once
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../../core/types/report.hpp"
#include "../../network/http/http_client.hpp"

namespace Sightline {
namespace Engine {

// Chooses the pages of a site audit: sitemap first, seed links otherwise,
// robots-filtered, de-duplicated and spread across site sections.
class Discovery {
public:
    Discovery(Network::Http::HttpClient&   client,
              int                          max_pages,
              std::optional<std::uint32_t> shuffle_seed = std::nullopt);

    boost::asio::awaitable<Core::DiscoveryResult>
    discover(const std::string&                seed_url,
             const std::optional<std::string>& robots_txt,
             const std::vector<std::string>&   seed_links);

    // Page URLs from /sitemap.xml, else /sitemap_index.xml, capped at MAX_SITEMAP_URLS.
    boost::asio::awaitable<std::vector<std::string>> sitemap_urls(const std::string& seed_url);

    // Seed first, then a round-robin over first-path-segment groups.
    std::vector<std::string> sample(const std::string&              seed_url,
                                    const std::vector<std::string>& candidates);

    static std::vector<std::string> filter_allowed(const std::vector<std::string>& urls,
                                                   const std::string&              robots_txt);
    static std::vector<std::string> deduplicate(const std::vector<std::string>& urls);

private:
    Network::Http::HttpClient& client_;
    int                        max_pages_;
    std::mt19937               rng_;

    boost::asio::awaitable<std::optional<std::string>> fetch_xml(const std::string& url);
};

}  // namespace Engine
}  // namespace Sightline
