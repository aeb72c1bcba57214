#pragma once
#include <string>
#include <vector>

namespace Sightline {
namespace Utils {

struct SitemapEntries {
    std::vector<std::string> pages;     // <url><loc>
    std::vector<std::string> sitemaps;  // <sitemap><loc>
};

class Sitemap {
public:
    // Malformed XML yields whatever could be recovered, possibly nothing.
    static SitemapEntries parse(const std::string& xml);
};

}  // namespace Utils
}  // namespace Sightline
