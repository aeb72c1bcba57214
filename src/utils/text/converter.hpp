#pragma once
#include <string>
#include <vector>

namespace Sightline {
namespace Utils {
namespace Text {

class Converter {
public:
    // html2md conversion followed by tidy_markdown().
    static std::string to_markdown(const std::string& html);

    // Trailing whitespace trimmed per line, blank runs collapsed to one blank
    // line, outer blank lines removed, exactly one trailing newline. Empty
    // input stays empty.
    static std::string tidy_markdown(const std::string& markdown);

    static std::vector<std::string> extract_links(const std::string& html);

    // Absolute http(s) links on the same host as `base_url`, fragments
    // stripped, first occurrence order.
    static std::vector<std::string> extract_internal_links(const std::string& html,
                                                           const std::string& base_url);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Sightline
