#include "extractor.hpp"
#include <algorithm>
#include <map>
#include "../../core/logger/logger.hpp"
#include "converter.hpp"
#include "string_utils.hpp"

namespace Sightline {
namespace Utils {
namespace Text {

namespace {

using Thresholds = Core::ExtractionThresholds;

constexpr size_t MIN_PARAGRAPH_CHARS = 25;

const std::vector<std::string>& negative_hints() {
    static const std::vector<std::string> hints = {
        "comment", "meta",   "footer", "footnote", "sidebar", "sponsor", "pagination",
        "related", "widget", "banner", "masthead", "menu",    "nav",     "promo",
        "share",   "social", "popup",  "cookie",   "advert",  "hidden"};
    return hints;
}

const std::vector<std::string>& positive_hints() {
    static const std::vector<std::string> hints = {
        "article", "body", "content", "entry", "main", "page", "post", "text", "blog", "story"};
    return hints;
}

double hint_weight(const std::string& value) {
    if (value.empty())
        return 0;
    std::string lowered = to_lower(value);
    double      weight  = 0;
    auto contains_any   = [&](const std::vector<std::string>& hints) {
        return std::any_of(hints.begin(), hints.end(), [&](const std::string& h) {
            return lowered.find(h) != std::string::npos;
        });
    };
    if (contains_any(negative_hints()))
        weight -= 25;
    if (contains_any(positive_hints()))
        weight += 25;
    return weight;
}

double class_weight(const GumboNode* node) {
    return hint_weight(Html::attribute(node, "class").value_or(""))
           + hint_weight(Html::attribute(node, "id").value_or(""));
}

double tag_weight(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_ARTICLE:
        case GUMBO_TAG_SECTION:
        case GUMBO_TAG_MAIN: return 5;
        case GUMBO_TAG_PRE:
        case GUMBO_TAG_TD:
        case GUMBO_TAG_BLOCKQUOTE: return 3;
        case GUMBO_TAG_ADDRESS:
        case GUMBO_TAG_OL:
        case GUMBO_TAG_UL:
        case GUMBO_TAG_DL:
        case GUMBO_TAG_DD:
        case GUMBO_TAG_DT:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_FORM: return -3;
        case GUMBO_TAG_H1:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
        case GUMBO_TAG_H4:
        case GUMBO_TAG_H5:
        case GUMBO_TAG_H6:
        case GUMBO_TAG_TH: return -5;
        default: return 0;
    }
}

size_t link_text_length(GumboNode* node) {
    std::vector<GumboNode*> anchors;
    Html::find_all(node, GUMBO_TAG_A, anchors);
    size_t total = 0;
    for (const GumboNode* a : anchors)
        total += Html::text_length(a);
    return total;
}

GumboNode* element_parent(const GumboNode* node) {
    GumboNode* parent = node ? node->parent : nullptr;
    return Html::is_element(parent) ? parent : nullptr;
}

}  // namespace

Extractor::Extractor(const std::vector<std::string>& strip_selectors)
    : strip_(Html::Selector::parse_all(strip_selectors)) {
}

const char* Extractor::strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::Empty: return "empty";
        case Strategy::Readability: return "readability";
        case Strategy::Main: return "main";
        case Strategy::Article: return "article";
        case Strategy::RoleMain: return "role-main";
        case Strategy::Body: return "body";
        case Strategy::Passthrough: return "passthrough";
    }
    return "unknown";
}

GumboNode* Extractor::readability_candidate(GumboNode* root) const {
    std::vector<GumboNode*> paragraphs;
    Html::find_all(root, GUMBO_TAG_P, paragraphs);

    // Ordered by first appearance so equal scores resolve to the earlier node.
    std::vector<GumboNode*>       order;
    std::map<GumboNode*, double>  scores;
    auto ensure = [&](GumboNode* node) {
        if (scores.emplace(node, tag_weight(node->v.element.tag) + class_weight(node)).second)
            order.push_back(node);
    };

    for (GumboNode* p : paragraphs) {
        std::string text = trim(Html::text_content(p));
        size_t length = char_length(text);
        if (length < MIN_PARAGRAPH_CHARS)
            continue;

        GumboNode* parent = element_parent(p);
        if (!parent)
            continue;
        GumboNode* grandparent = element_parent(parent);

        double score = 1.0 + static_cast<double>(std::count(text.begin(), text.end(), ','))
                       + std::min(static_cast<double>(length) / 100.0, 3.0);

        ensure(parent);
        scores[parent] += score;
        if (grandparent) {
            ensure(grandparent);
            scores[grandparent] += score / 2.0;
        }
    }

    GumboNode* best       = nullptr;
    double     best_score = 0;
    for (GumboNode* node : order) {
        size_t length = Html::text_length(node);
        double density =
            length == 0 ? 1.0 : static_cast<double>(link_text_length(node)) / static_cast<double>(length);
        double final_score = scores[node] * (1.0 - density);
        if (!best || final_score > best_score) {
            best       = node;
            best_score = final_score;
        }
    }
    return best;
}

Extractor::Extraction Extractor::extract(const std::string& html) const {
    Extraction result;
    if (is_blank(html))
        return result;

    Html::Document doc(html);
    auto choose = [&](Strategy strategy, const GumboNode* node) {
        result.strategy = strategy;
        result.html     = Html::serialize(node, strip_);
        Core::Logger::debug(std::string("Extracted content via ") + strategy_name(strategy));
        return result;
    };

    try {
        GumboNode* candidate = readability_candidate(doc.root());
        if (candidate && Html::text_length(candidate) > Thresholds::READABILITY_MIN_CHARS)
            return choose(Strategy::Readability, candidate);
    } catch (const std::exception& e) {
        Core::Logger::warn(std::string("Readability extraction failed: ") + e.what());
    }

    GumboNode* main = Html::find_first(doc.root(), GUMBO_TAG_MAIN);
    if (main && Html::text_length(main) > Thresholds::LANDMARK_MIN_CHARS)
        return choose(Strategy::Main, main);

    std::vector<GumboNode*> articles;
    Html::find_all(doc.root(), GUMBO_TAG_ARTICLE, articles);
    GumboNode* longest        = nullptr;
    size_t     longest_length = 0;
    for (GumboNode* article : articles) {
        size_t length = Html::text_length(article);
        if (!longest || length > longest_length) {
            longest        = article;
            longest_length = length;
        }
    }
    if (longest && longest_length > Thresholds::LANDMARK_MIN_CHARS)
        return choose(Strategy::Article, longest);

    GumboNode* role_main = Html::find_first_with_attribute(doc.root(), "role", "main");
    if (role_main && Html::text_length(role_main) > Thresholds::LANDMARK_MIN_CHARS)
        return choose(Strategy::RoleMain, role_main);

    if (GumboNode* body = doc.explicit_body())
        return choose(Strategy::Body, body);

    // No <body> in the source: keep the whole fragment, still stripped.
    result.strategy = Strategy::Passthrough;
    GumboNode* implied = Html::find_first(doc.root(), GUMBO_TAG_BODY);
    result.html        = Html::serialize(implied ? implied : doc.root(), strip_);
    return result;
}

std::string Extractor::to_markdown(const std::string& html) const {
    Extraction extraction = extract(html);
    if (extraction.html.empty())
        return "";
    return Converter::to_markdown(extraction.html);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Sightline
