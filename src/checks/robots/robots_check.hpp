#pragma once
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>
#include <vector>
#include "../../core/types/report.hpp"
#include "../../network/http/http_client.hpp"

namespace Sightline {
namespace Checks {

struct RobotsOutcome {
    Core::RobotsReport         report;
    std::optional<std::string> raw;  // present only when robots.txt was fetched with 200
};

class RobotsCheck {
public:
    // An empty `agents` list means the default AI agent list.
    static boost::asio::awaitable<RobotsOutcome>
    run(Network::Http::HttpClient&      client,
        const std::string&              url,
        const std::vector<std::string>& agents);

    static Core::RobotsReport evaluate(const std::string&              robots_txt,
                                       const std::vector<std::string>& agents);

    static std::string robots_url(const std::string& url);
};

}  // namespace Checks
}  // namespace Sightline
