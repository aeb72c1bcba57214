#pragma once
#include <string>
#include <vector>
#include "../../core/types/report.hpp"

namespace Sightline {
namespace Checks {

class StructuredDataCheck {
public:
    static Core::StructuredDataReport analyze(const std::string& html);

    // Raw bodies of every <script type="application/ld+json"> in document order.
    static std::vector<std::string> find_json_ld_blocks(const std::string& html);
};

}  // namespace Checks
}  // namespace Sightline
