#include <algorithm>

#include "report.hpp"
#include "report_json.hpp"

namespace Sightline {
namespace Core {

using json = nlohmann::json;

size_t RobotsReport::allowed_count() const {
    return static_cast<size_t>(std::count_if(
        agents.begin(), agents.end(), [](const AgentAccess& a) { return a.allowed; }));
}

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

void to_json(json& j, const AgentAccess& agent) {
    j = json{{"name", agent.name}, {"allowed", agent.allowed}, {"reason", agent.reason}};
}

void to_json(json& j, const RobotsReport& report) {
    j = json{{"found", report.found},
             {"agents", report.agents},
             {"score", report.score},
             {"max_score", RobotsReport::max_score()},
             {"summary", report.summary}};
}

void to_json(json& j, const ContextFileReport& report) {
    j = json{{"found", report.found},
             {"url", optional_string(report.url)},
             {"full_found", report.full_found},
             {"full_url", optional_string(report.full_url)},
             {"score", report.score},
             {"max_score", ContextFileReport::max_score()},
             {"summary", report.summary}};
}

void to_json(json& j, const SchemaEntity& entity) {
    j = json{{"type", entity.type}, {"properties", entity.properties}};
}

void to_json(json& j, const StructuredDataReport& report) {
    j = json{{"blocks_found", report.blocks_found},
             {"entities", report.entities},
             {"score", report.score},
             {"max_score", StructuredDataReport::max_score()},
             {"summary", report.summary}};
}

void to_json(json& j, const ContentReport& report) {
    j = json{{"word_count", report.word_count},
             {"char_count", report.char_count},
             {"has_headings", report.has_headings},
             {"has_lists", report.has_lists},
             {"has_code_blocks", report.has_code_blocks},
             {"chunk_count", report.chunk_count},
             {"avg_chunk_words", report.avg_chunk_words},
             {"chunks_in_sweet_spot", report.chunks_in_sweet_spot},
             {"heading_count", report.heading_count},
             {"heading_hierarchy_valid", report.heading_hierarchy_valid},
             {"readability_grade",
              report.readability_grade ? json(*report.readability_grade) : json(nullptr)},
             {"answer_first_ratio", report.answer_first_ratio},
             {"score", report.score},
             {"max_score", ContentReport::max_score()},
             {"summary", report.summary}};
}

void to_json(json& j, const PageScore& page) {
    j = json{{"url", page.url},
             {"structured_data", page.structured_data},
             {"content", page.content},
             {"errors", page.errors}};
}

void to_json(json& j, const DiscoveryResult& discovery) {
    j = json{{"method", discovery.method},
             {"urls_found", discovery.urls_found},
             {"urls_sampled", discovery.urls_sampled},
             {"summary", discovery.summary}};
}

void to_json(json& j, const AuditReport& report) {
    j = json{{"url", report.url},
             {"overall_score", report.overall_score},
             {"robots", report.robots},
             {"context_file", report.context_file},
             {"structured_data", report.structured_data},
             {"content", report.content},
             {"errors", report.errors}};
}

void to_json(json& j, const SiteAuditReport& report) {
    j = json{{"url", report.url},
             {"domain", report.domain},
             {"overall_score", report.overall_score},
             {"robots", report.robots},
             {"context_file", report.context_file},
             {"structured_data", report.structured_data},
             {"content", report.content},
             {"discovery", report.discovery},
             {"pages", report.pages},
             {"pages_attempted", report.pages_attempted},
             {"pages_failed", report.pages_failed},
             {"errors", report.errors}};
}

}  // namespace Core
}  // namespace Sightline
