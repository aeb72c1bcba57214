#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Sightline {
namespace Core {

struct Constants {
    static constexpr const char* VERSION    = "0.1.0";
    static constexpr const char* USER_AGENT = "Sightline/0.1 (+https://github.com/sightline-audit)";

    static constexpr int    DEFAULT_MAX_PAGES           = 10;
    static constexpr int    REQUEST_TIMEOUT_SECONDS     = 15;
    static constexpr double DEFAULT_CRAWL_DELAY_SECONDS = 1.0;
    static constexpr int    SITE_AUDIT_DEADLINE_SECONDS = 90;
    static constexpr int    DEFAULT_BATCH_CONCURRENCY   = 3;
    static constexpr size_t MAX_CONCURRENT_CRAWLS       = 3;
    static constexpr int    MAX_REDIRECTS               = 10;
    static constexpr int    CURL_WORKER_THREADS         = 4;
    static constexpr size_t MAX_BODY_BYTES              = 16 * 1024 * 1024;

    static constexpr const char* DISCOVERY_AGENT    = "GPTBot";
    static constexpr size_t      MAX_SITEMAP_URLS   = 500;
    static constexpr size_t      MAX_CHILD_SITEMAPS = 10;

    static constexpr const char* CONTEXT_FILE_NAME      = "llms";
    static constexpr const char* CONTEXT_FULL_FILE_NAME = "llms-full";
};

// Pillar maxima sum to 100.
struct Scoring {
    static constexpr double ROBOTS_MAX       = 25;
    static constexpr double CONTEXT_FILE_MAX = 10;
    static constexpr double SCHEMA_MAX       = 25;
    static constexpr double CONTENT_MAX      = 40;

    static constexpr double SCHEMA_BASE_SCORE       = 8;
    static constexpr double SCHEMA_HIGH_VALUE_BONUS = 5;
    static constexpr double SCHEMA_STANDARD_BONUS   = 3;

    // (min_words, base_score), evaluated top-down, first match wins.
    static constexpr std::array<std::pair<int, int>, 4> CONTENT_WORD_TIERS = {
        {{1500, 25}, {800, 20}, {400, 15}, {150, 8}}};
    static constexpr double CONTENT_HEADING_BONUS = 7;
    static constexpr double CONTENT_LIST_BONUS    = 5;
    static constexpr double CONTENT_CODE_BONUS    = 3;

    static constexpr int    SHALLOW_PAGE_WEIGHT  = 3;
    static constexpr int    MID_PAGE_WEIGHT      = 2;
    static constexpr int    DEEP_PAGE_WEIGHT     = 1;
};

struct ExtractionThresholds {
    static constexpr size_t READABILITY_MIN_CHARS = 100;
    static constexpr size_t LANDMARK_MIN_CHARS    = 50;
};

inline const std::vector<std::string>& default_ai_agents() {
    static const std::vector<std::string> agents = {"GPTBot",
                                                    "ChatGPT-User",
                                                    "Google-Extended",
                                                    "ClaudeBot",
                                                    "PerplexityBot",
                                                    "Amazonbot",
                                                    "OAI-SearchBot",
                                                    "DeepSeek-AI",
                                                    "Grok",
                                                    "Meta-ExternalAgent",
                                                    "cohere-ai",
                                                    "AI2Bot",
                                                    "ByteSpider"};
    return agents;
}

inline const std::vector<std::string>& high_value_schema_types() {
    static const std::vector<std::string> types = {
        "FAQPage", "HowTo", "Article", "Product", "Recipe"};
    return types;
}

inline const std::vector<std::string>& default_strip_selectors() {
    static const std::vector<std::string> selectors = {"script",
                                                       "style",
                                                       "noscript",
                                                       "iframe",
                                                       "svg",
                                                       "nav",
                                                       "footer",
                                                       "aside",
                                                       "form",
                                                       "[role=navigation]",
                                                       ".cookie",
                                                       ".advert",
                                                       "#cookie-banner"};
    return selectors;
}

}  // namespace Core
}  // namespace Sightline
