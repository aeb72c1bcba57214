#pragma once
#include <optional>
#include <string>
#include "../../core/types/report.hpp"

namespace Sightline {
namespace Checks {

class ContentCheck {
public:
    static Core::ContentReport analyze(const std::string& markdown);

    // Flesch-Kincaid grade level, rounded to one decimal. Empty below 30 words.
    static std::optional<double> readability_grade(const std::string& text);
    // Fraction of heading-delimited sections whose first sentence is not a question.
    static double answer_first_ratio(const std::string& markdown);
};

}  // namespace Checks
}  // namespace Sightline
