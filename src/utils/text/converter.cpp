#include "converter.hpp"
#include <gumbo.h>
#include <unordered_set>
#include "../html/document.hpp"
#include "../url/url.hpp"
#include "html2md.h"
#include "string_utils.hpp"

namespace Sightline {
namespace Utils {
namespace Text {

std::string Converter::to_markdown(const std::string& html) {
    if (is_blank(html))
        return "";
    return tidy_markdown(html2md::Convert(html));
}

std::string Converter::tidy_markdown(const std::string& markdown) {
    std::string out;
    bool        pending_blank = false;
    for (const auto& raw : split_lines(markdown)) {
        std::string line = rtrim(raw);
        if (line.empty()) {
            pending_blank = !out.empty();
            continue;
        }
        if (pending_blank)
            out += '\n';
        out += line;
        out += '\n';
        pending_blank = false;
    }
    return out;
}

std::vector<std::string> Converter::extract_links(const std::string& html) {
    std::vector<std::string> links;
    if (html.empty())
        return links;

    Html::Document           doc(html);
    std::vector<GumboNode*> anchors;
    Html::find_all(doc.root(), GUMBO_TAG_A, anchors);
    for (const GumboNode* a : anchors) {
        if (auto href = Html::attribute(a, "href"))
            links.push_back(*href);
    }
    return links;
}

std::vector<std::string> Converter::extract_internal_links(const std::string& html,
                                                           const std::string& base_url) {
    std::vector<std::string>        internal;
    std::unordered_set<std::string> seen;
    for (const auto& href : extract_links(html)) {
        std::string absolute = Url::strip_fragment(Url::resolve(base_url, trim(href)));
        if (absolute.empty())
            continue;
        std::string scheme = to_lower(Url::parse(absolute).scheme);
        if (scheme != "http" && scheme != "https")
            continue;
        if (!Url::is_same_domain(absolute, base_url))
            continue;
        if (seen.insert(absolute).second)
            internal.push_back(std::move(absolute));
    }
    return internal;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Sightline
