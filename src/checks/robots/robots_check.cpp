#include "robots_check.hpp"
#include "../../core/logger/logger.hpp"
#include "../../engine/scoring/scoring.hpp"
#include "../../utils/robotstxt/robotstxt.hpp"
#include "../../utils/url/url.hpp"

namespace Sightline {
namespace Checks {

std::string RobotsCheck::robots_url(const std::string& url) {
    return Utils::Url::origin(url) + "/robots.txt";
}

Core::RobotsReport RobotsCheck::evaluate(const std::string&              robots_txt,
                                         const std::vector<std::string>& agents) {
    const auto& names  = agents.empty() ? Core::default_ai_agents() : agents;
    auto        robots = Utils::RobotsTxt::parse(robots_txt);

    Core::RobotsReport report;
    report.found = true;
    for (const auto& name : names) {
        bool allowed = robots.is_allowed(name, "/");
        report.agents.push_back({name, allowed, allowed ? "Allowed" : "Blocked by robots.txt"});
    }

    size_t allowed = report.allowed_count();
    report.score   = Engine::Scoring::score_robots(allowed, names.size());
    report.summary = std::to_string(allowed) + "/" + std::to_string(names.size()) + " AI bots allowed";
    return report;
}

boost::asio::awaitable<RobotsOutcome>
RobotsCheck::run(Network::Http::HttpClient&      client,
                 const std::string&              url,
                 const std::vector<std::string>& agents) {
    RobotsOutcome outcome;
    std::string   target = robots_url(url);
    Response      res    = co_await client.get(target);

    if (res.status_code == static_cast<long>(Network::Http::HTTPCode::NetworkError)) {
        outcome.report.summary = "Failed to fetch robots.txt: " + res.error;
        Core::Logger::debug(outcome.report.summary);
        co_return outcome;
    }
    if (res.status_code != static_cast<long>(Network::Http::HTTPCode::Ok)) {
        outcome.report.summary = "robots.txt returned HTTP " + std::to_string(res.status_code);
        co_return outcome;
    }

    outcome.report = evaluate(res.body, agents);
    outcome.raw    = std::move(res.body);
    co_return outcome;
}

}  // namespace Checks
}  // namespace Sightline
