#pragma once
#include <string>
#include <vector>
#include "../../core/types/report.hpp"

namespace Sightline {
namespace Engine {

struct SiteScores {
    Core::StructuredDataReport structured_data;
    Core::ContentReport        content;
    double                     overall_score = 0;
};

// Depth-weighted combination of per-page scores. Pure: same input, same output.
class Aggregator {
public:
    static SiteScores aggregate(const std::vector<Core::PageScore>& pages,
                                const Core::RobotsReport&           robots,
                                const Core::ContextFileReport&      context_file);

    // 3 for depth 0-1, 2 for depth 2, 1 deeper.
    static int page_weight(const std::string& url);

    // A page with errors still counts when it produced words.
    static bool is_successful(const Core::PageScore& page);
};

}  // namespace Engine
}  // namespace Sightline
