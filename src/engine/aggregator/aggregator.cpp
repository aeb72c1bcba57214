#include "aggregator.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Sightline {
namespace Engine {

using namespace Sightline::Core;
using Utils::Text::round1;

namespace {

constexpr const char* NO_PAGES = "No pages audited successfully";

}  // namespace

int Aggregator::page_weight(const std::string& url) {
    int depth = Utils::Url::path_depth(url);
    if (depth <= 1)
        return Core::Scoring::SHALLOW_PAGE_WEIGHT;
    if (depth == 2)
        return Core::Scoring::MID_PAGE_WEIGHT;
    return Core::Scoring::DEEP_PAGE_WEIGHT;
}

bool Aggregator::is_successful(const PageScore& page) {
    return page.errors.empty() || page.content.word_count > 0;
}

SiteScores Aggregator::aggregate(const std::vector<PageScore>& pages,
                                 const RobotsReport&           robots,
                                 const ContextFileReport&      context_file) {
    SiteScores result;

    std::vector<const PageScore*> successful;
    for (const auto& page : pages) {
        if (is_successful(page))
            successful.push_back(&page);
    }

    if (successful.empty()) {
        result.structured_data.summary = NO_PAGES;
        result.content.summary         = NO_PAGES;
        result.overall_score           = round1(robots.score + context_file.score);
        return result;
    }

    double total_weight = 0;
    double schema_sum   = 0;
    double content_sum  = 0;
    long   word_sum     = 0;
    long   char_sum     = 0;
    auto&  schema       = result.structured_data;
    auto&  content      = result.content;
    for (const PageScore* page : successful) {
        double weight = page_weight(page->url);
        total_weight += weight;

        schema.entities.insert(schema.entities.end(),
                               page->structured_data.entities.begin(),
                               page->structured_data.entities.end());
        schema.blocks_found += page->structured_data.blocks_found;
        schema_sum += page->structured_data.score * weight;

        content_sum += page->content.score * weight;
        word_sum += page->content.word_count;
        char_sum += page->content.char_count;
        content.has_headings    = content.has_headings || page->content.has_headings;
        content.has_lists       = content.has_lists || page->content.has_lists;
        content.has_code_blocks = content.has_code_blocks || page->content.has_code_blocks;
    }

    const long n       = static_cast<long>(successful.size());
    schema.score       = round1(schema_sum / total_weight);
    content.score      = round1(content_sum / total_weight);
    content.word_count = static_cast<int>(word_sum / n);
    content.char_count = static_cast<int>(char_sum / n);

    schema.summary = std::to_string(schema.blocks_found) + " JSON-LD block(s) across "
                     + std::to_string(n) + " pages (weighted avg score "
                     + Utils::Text::format_decimal(schema.score) + ")";
    content.summary = "avg " + std::to_string(content.word_count) + " words across "
                      + std::to_string(n) + " pages (weighted avg score "
                      + Utils::Text::format_decimal(content.score) + ")";

    result.overall_score = round1(robots.score + context_file.score + schema.score + content.score);
    return result;
}

}  // namespace Engine
}  // namespace Sightline
