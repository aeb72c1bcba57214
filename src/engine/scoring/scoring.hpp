#pragma once
#include <string>
#include <vector>
#include "../../core/types/report.hpp"

namespace Sightline {
namespace Engine {
namespace Scoring {

// Each returns a value in [0, max_score()] of the matching report type.
double score_robots(size_t allowed, size_t total);
double score_context_file(bool found);
double score_structured_data(const std::vector<Core::SchemaEntity>& entities);
double score_content(int word_count, bool has_headings, bool has_lists, bool has_code_blocks);

}  // namespace Scoring
}  // namespace Engine
}  // namespace Sightline
