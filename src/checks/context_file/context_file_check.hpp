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

class ContextFileCheck {
public:
    static boost::asio::awaitable<Core::ContextFileReport>
    run(Network::Http::HttpClient& client, const std::string& url);

    // "/{name}.txt" then "/.well-known/{name}.txt".
    static std::vector<std::string> probe_paths(const std::string& name);

private:
    static boost::asio::awaitable<std::optional<std::string>>
    probe(Network::Http::HttpClient&      client,
          const std::string&              origin,
          const std::vector<std::string>& paths);
};

}  // namespace Checks
}  // namespace Sightline
