#include "context_file_check.hpp"
#include "../../core/logger/logger.hpp"
#include "../../engine/scoring/scoring.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Sightline {
namespace Checks {

using Core::Constants;

std::vector<std::string> ContextFileCheck::probe_paths(const std::string& name) {
    return {"/" + name + ".txt", "/.well-known/" + name + ".txt"};
}

boost::asio::awaitable<std::optional<std::string>>
ContextFileCheck::probe(Network::Http::HttpClient&      client,
                        const std::string&              origin,
                        const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        std::string candidate = origin + path;
        Response    res       = co_await client.get(candidate);
        if (res.status_code == static_cast<long>(Network::Http::HTTPCode::Ok)
            && !Utils::Text::is_blank(res.body))
            co_return candidate;
        Core::Logger::debug("No context file at " + candidate
                            + (res.error.empty() ? "" : " (" + res.error + ")"));
    }
    co_return std::nullopt;
}

boost::asio::awaitable<Core::ContextFileReport>
ContextFileCheck::run(Network::Http::HttpClient& client, const std::string& url) {
    std::string origin = Utils::Url::origin(url);

    Core::ContextFileReport report;
    report.url      = co_await probe(client, origin, probe_paths(Constants::CONTEXT_FILE_NAME));
    report.full_url = co_await probe(client, origin, probe_paths(Constants::CONTEXT_FULL_FILE_NAME));
    report.found      = report.url.has_value();
    report.full_found = report.full_url.has_value();
    report.score      = Engine::Scoring::score_context_file(report.found);

    std::vector<std::string> parts;
    if (report.found)
        parts.push_back("llms.txt at " + *report.url);
    if (report.full_found)
        parts.push_back("llms-full.txt at " + *report.full_url);
    report.summary = parts.empty() ? "llms.txt not found" : "Found: " + Utils::Text::join(parts, ", ");
    co_return report;
}

}  // namespace Checks
}  // namespace Sightline
