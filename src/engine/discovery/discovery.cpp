#include "discovery.hpp"
#include <algorithm>
#include <array>
#include <deque>
#include <iterator>
#include <map>
#include <unordered_set>
#include "../../core/logger/logger.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"
#include "../../utils/sitemap/sitemap.hpp"
#include "../../utils/url/url.hpp"

namespace Sightline {
namespace Engine {

using namespace Sightline::Core;
using namespace Sightline::Network::Http;
using namespace Sightline::Utils;

namespace {
constexpr std::array<const char*, 2> SITEMAP_PATHS = {"/sitemap.xml", "/sitemap_index.xml"};
}  // namespace

Discovery::Discovery(HttpClient& client, int max_pages, std::optional<std::uint32_t> shuffle_seed)
    : client_(client),
      max_pages_(max_pages),
      rng_(shuffle_seed ? *shuffle_seed : std::random_device{}()) {
}

boost::asio::awaitable<std::optional<std::string>> Discovery::fetch_xml(const std::string& url) {
    Response res = co_await client_.get(url);
    if (res.status_code != static_cast<long>(HTTPCode::Ok)) {
        Logger::debug("No sitemap at " + url);
        co_return std::nullopt;
    }
    co_return std::move(res.body);
}

boost::asio::awaitable<std::vector<std::string>>
Discovery::sitemap_urls(const std::string& seed_url) {
    std::string              origin = Url::origin(seed_url);
    std::vector<std::string> pages;

    for (const char* path : SITEMAP_PATHS) {
        auto xml = co_await fetch_xml(origin + path);
        if (!xml)
            continue;

        SitemapEntries entries = Sitemap::parse(*xml);
        pages.insert(pages.end(), entries.pages.begin(), entries.pages.end());

        size_t children = std::min(entries.sitemaps.size(), Constants::MAX_CHILD_SITEMAPS);
        for (size_t i = 0; i < children && pages.size() < Constants::MAX_SITEMAP_URLS; ++i) {
            auto child_xml = co_await fetch_xml(entries.sitemaps[i]);
            if (!child_xml)
                continue;
            auto child = Sitemap::parse(*child_xml);
            pages.insert(pages.end(), child.pages.begin(), child.pages.end());
        }

        if (!pages.empty())
            break;
    }

    if (pages.size() > Constants::MAX_SITEMAP_URLS)
        pages.resize(Constants::MAX_SITEMAP_URLS);
    co_return pages;
}

std::vector<std::string> Discovery::filter_allowed(const std::vector<std::string>& urls,
                                                   const std::string&              robots_txt) {
    auto                     robots = RobotsTxt::parse(robots_txt);
    std::vector<std::string> allowed;
    std::copy_if(urls.begin(), urls.end(), std::back_inserter(allowed), [&](const std::string& url) {
        return robots.is_allowed(Constants::DISCOVERY_AGENT, url);
    });
    return allowed;
}

std::vector<std::string> Discovery::deduplicate(const std::vector<std::string>& urls) {
    std::vector<std::string>        unique;
    std::unordered_set<std::string> seen;
    for (const auto& url : urls) {
        if (seen.insert(Url::normalize(url)).second)
            unique.push_back(url);
    }
    return unique;
}

std::vector<std::string> Discovery::sample(const std::string&              seed_url,
                                           const std::vector<std::string>& candidates) {
    std::vector<std::string>        selected{seed_url};
    std::unordered_set<std::string> seen{Url::normalize(seed_url)};
    if (max_pages_ <= 1)
        return selected;

    std::map<std::string, std::deque<std::string>> groups;
    for (const auto& url : candidates) {
        if (seen.count(Url::normalize(url)))
            continue;
        groups[Url::first_path_segment(url)].push_back(url);
    }
    for (auto& [segment, group] : groups)
        std::shuffle(group.begin(), group.end(), rng_);

    const size_t budget = static_cast<size_t>(max_pages_);
    while (selected.size() < budget && !groups.empty()) {
        for (auto it = groups.begin(); it != groups.end() && selected.size() < budget;) {
            std::string url = std::move(it->second.front());
            it->second.pop_front();
            if (seen.insert(Url::normalize(url)).second)
                selected.push_back(std::move(url));
            it = it->second.empty() ? groups.erase(it) : std::next(it);
        }
    }
    return selected;
}

boost::asio::awaitable<DiscoveryResult>
Discovery::discover(const std::string&                seed_url,
                    const std::optional<std::string>& robots_txt,
                    const std::vector<std::string>&   seed_links) {
    DiscoveryResult result;
    result.method = "sitemap";

    std::vector<std::string> candidates = co_await sitemap_urls(seed_url);
    if (candidates.empty()) {
        result.method = "spider";
        candidates    = seed_links;
    }
    result.urls_found = static_cast<int>(candidates.size());

    if (robots_txt && !candidates.empty())
        candidates = filter_allowed(candidates, *robots_txt);

    result.urls_sampled = sample(seed_url, deduplicate(candidates));
    result.summary      = "method=" + result.method + ", found=" + std::to_string(result.urls_found)
                     + ", sampled=" + std::to_string(result.urls_sampled.size());
    Logger::info("Discovery: " + result.summary);
    co_return result;
}

}  // namespace Engine
}  // namespace Sightline
