/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <string>
#include <vector>

namespace Sightline {
namespace Utils {

class RobotsTxt {
public:
    RobotsTxt() = default;

    static RobotsTxt parse(const std::string& content);

    // `target` may be a bare path ("/") or an absolute URL. `user_agent` is
    // matched on its product token.
    bool   is_allowed(const std::string& user_agent, const std::string& target) const;
    double get_crawl_delay(const std::string& user_agent) const;

    // "Sightline/0.1 (+url)" -> "Sightline", the form robots.txt groups are matched on.
    static std::string product_token(const std::string& user_agent);

    const std::string& content() const {
        return content_;
    }

private:
    std::string content_;
};

}  // namespace Utils
}  // namespace Sightline
