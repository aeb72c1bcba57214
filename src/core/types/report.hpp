#pragma once
#include <optional>
#include <string>
#include <vector>

#include "constants.hpp"

namespace Sightline {
namespace Core {

// Shared shape of the four pillar reports. Each pillar adds its own evidence.
struct PillarReport {
    double      score = 0;
    std::string summary;
};

struct AgentAccess {
    std::string name;
    bool        allowed = false;
    std::string reason;
};

struct RobotsReport : PillarReport {
    bool                     found = false;
    std::vector<AgentAccess> agents;

    static constexpr double max_score() {
        return Scoring::ROBOTS_MAX;
    }
    size_t allowed_count() const;
};

struct ContextFileReport : PillarReport {
    bool                       found = false;
    std::optional<std::string> url;
    bool                       full_found = false;
    std::optional<std::string> full_url;

    static constexpr double max_score() {
        return Scoring::CONTEXT_FILE_MAX;
    }
};

struct SchemaEntity {
    std::string              type;
    std::vector<std::string> properties;
};

struct StructuredDataReport : PillarReport {
    int                       blocks_found = 0;
    std::vector<SchemaEntity> entities;

    static constexpr double max_score() {
        return Scoring::SCHEMA_MAX;
    }
};

struct ContentReport : PillarReport {
    int  word_count      = 0;
    int  char_count      = 0;
    bool has_headings    = false;
    bool has_lists       = false;
    bool has_code_blocks = false;

    // Informational, not scored.
    int                   chunk_count             = 0;
    int                   avg_chunk_words         = 0;
    int                   chunks_in_sweet_spot    = 0;
    int                   heading_count           = 0;
    bool                  heading_hierarchy_valid = true;
    std::optional<double> readability_grade;
    double                answer_first_ratio = 0;

    static constexpr double max_score() {
        return Scoring::CONTENT_MAX;
    }
};

struct CrawlResult {
    std::string              url;
    bool                     success     = false;
    long                     status_code = 0;
    std::string              html;
    std::string              markdown;
    std::vector<std::string> internal_links;
    std::string              error;
};

struct PageScore {
    std::string              url;
    StructuredDataReport     structured_data;
    ContentReport            content;
    std::vector<std::string> errors;
};

struct DiscoveryResult {
    std::string              method;
    int                      urls_found = 0;
    std::vector<std::string> urls_sampled;
    std::string              summary;
};

struct AuditReport {
    std::string              url;
    double                   overall_score = 0;
    RobotsReport             robots;
    ContextFileReport        context_file;
    StructuredDataReport     structured_data;
    ContentReport            content;
    std::vector<std::string> errors;
};

struct SiteAuditReport {
    std::string              url;
    std::string              domain;
    double                   overall_score = 0;
    RobotsReport             robots;
    ContextFileReport        context_file;
    StructuredDataReport     structured_data;
    ContentReport            content;
    DiscoveryResult          discovery;
    std::vector<PageScore>   pages;
    int                      pages_attempted = 0;
    int                      pages_failed    = 0;
    std::vector<std::string> errors;
};

constexpr double max_overall_score() {
    return RobotsReport::max_score() + ContextFileReport::max_score()
           + StructuredDataReport::max_score() + ContentReport::max_score();
}

}  // namespace Core
}  // namespace Sightline
