#include "scoring.hpp"
#include <algorithm>
#include <set>
#include "../../utils/text/string_utils.hpp"

namespace Sightline {
namespace Engine {
namespace Scoring {

using Weights = Core::Scoring;

double score_robots(size_t allowed, size_t total) {
    if (total == 0)
        return 0;
    double ratio = static_cast<double>(std::min(allowed, total)) / static_cast<double>(total);
    return Utils::Text::round1(Weights::ROBOTS_MAX * ratio);
}

double score_context_file(bool found) {
    return found ? Weights::CONTEXT_FILE_MAX : 0;
}

double score_structured_data(const std::vector<Core::SchemaEntity>& entities) {
    if (entities.empty())
        return 0;

    std::set<std::string> unique_types;
    for (const auto& entity : entities)
        unique_types.insert(entity.type);

    const auto& high_value = Core::high_value_schema_types();
    double      score      = Weights::SCHEMA_BASE_SCORE;
    for (const auto& type : unique_types) {
        bool is_high = std::find(high_value.begin(), high_value.end(), type) != high_value.end();
        score += is_high ? Weights::SCHEMA_HIGH_VALUE_BONUS : Weights::SCHEMA_STANDARD_BONUS;
    }
    return std::min(score, Weights::SCHEMA_MAX);
}

double score_content(int word_count, bool has_headings, bool has_lists, bool has_code_blocks) {
    double score = 0;
    for (const auto& [min_words, points] : Weights::CONTENT_WORD_TIERS) {
        if (word_count >= min_words) {
            score = points;
            break;
        }
    }
    if (has_headings)
        score += Weights::CONTENT_HEADING_BONUS;
    if (has_lists)
        score += Weights::CONTENT_LIST_BONUS;
    if (has_code_blocks)
        score += Weights::CONTENT_CODE_BONUS;
    return std::min(score, Weights::CONTENT_MAX);
}

}  // namespace Scoring
}  // namespace Engine
}  // namespace Sightline
