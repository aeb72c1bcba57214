/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <cctype>
#include <charconv>
#include <optional>
#include "../../core/logger/logger.hpp"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "robots.h"

namespace Sightline {
namespace Utils {

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt robots;
    robots.content_ = content;
    return robots;
}

bool RobotsTxt::is_allowed(const std::string& user_agent, const std::string& target) const {
    // The matcher trims group names in the file to their product token, so the
    // caller's name is trimmed the same way ("AI2Bot" and its group both become "AI").
    googlebot::RobotsMatcher matcher;
    std::vector<std::string> user_agents{product_token(user_agent)};
    return matcher.AllowedByRobots(content_, &user_agents, target);
}

namespace {
class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    double GetDelay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return *specific_delay_;
        if (global_delay_)
            return *global_delay_;
        return 0.0;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            double delay = 0.0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), delay);
            if (ec != std::errc() || delay < 0) {
                Core::Logger::debug("Ignoring malformed Crawl-delay on line "
                                    + std::to_string(line_num));
            }
            else if (seen_specific_agent_) {
                specific_delay_ = delay;
            }
            else if (seen_global_agent_) {
                global_delay_ = delay;
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};
}  // namespace

std::string RobotsTxt::product_token(const std::string& user_agent) {
    size_t end = 0;
    while (end < user_agent.size()) {
        char c = user_agent[end];
        if (!std::isalpha(static_cast<unsigned char>(c)) && c != '-' && c != '_')
            break;
        ++end;
    }
    return user_agent.substr(0, end);
}

double RobotsTxt::get_crawl_delay(const std::string& user_agent) const {
    std::vector<std::string> ua_list{product_token(user_agent)};
    CrawlDelayMatcher        matcher(ua_list);
    return matcher.GetDelay(content_);
}

}  // namespace Utils
}  // namespace Sightline
