#pragma once
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../html/document.hpp"

namespace Sightline {
namespace Utils {
namespace Text {

// Picks the main content of a noisy page. Candidates are tried in order and the
// first whose text length clears its threshold wins.
class Extractor {
public:
    enum class Strategy { Empty, Readability, Main, Article, RoleMain, Body, Passthrough };

    struct Extraction {
        Strategy    strategy = Strategy::Empty;
        std::string html;
    };

    explicit Extractor(const std::vector<std::string>& strip_selectors =
                           Core::default_strip_selectors());

    Extraction  extract(const std::string& html) const;
    std::string to_markdown(const std::string& html) const;

    static const char* strategy_name(Strategy strategy);

private:
    std::vector<Html::Selector> strip_;

    GumboNode* readability_candidate(GumboNode* root) const;
};

}  // namespace Text
}  // namespace Utils
}  // namespace Sightline
