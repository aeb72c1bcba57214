#include "content_check.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <vector>
#include "../../engine/scoring/scoring.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Sightline {
namespace Checks {

namespace {

using namespace Utils::Text;

constexpr size_t MIN_WORDS_FOR_GRADE = 30;
constexpr int    SWEET_SPOT_MIN      = 50;
constexpr int    SWEET_SPOT_MAX      = 150;

const std::regex& heading_pattern() {
    static const std::regex pattern(R"(^(#{1,6})(\s|$))");
    return pattern;
}

const std::regex& list_pattern() {
    static const std::regex pattern(R"(^\s*[-*+](\s|$))");
    return pattern;
}

// Text between headings; heading lines themselves are dropped.
std::vector<std::string> sections_of(const std::string& markdown) {
    std::vector<std::string> sections(1);
    for (const auto& line : split_lines(markdown)) {
        if (std::regex_search(line, heading_pattern())) {
            sections.emplace_back();
            continue;
        }
        sections.back() += line;
        sections.back() += '\n';
    }

    std::vector<std::string> non_empty;
    for (auto& section : sections) {
        std::string trimmed = trim(section);
        if (!trimmed.empty())
            non_empty.push_back(std::move(trimmed));
    }
    return non_empty;
}

int count_syllables(const std::string& word) {
    int  groups   = 0;
    bool in_group = false;
    for (char c : word) {
        char lower    = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        bool is_vowel = lower == 'a' || lower == 'e' || lower == 'i' || lower == 'o' || lower == 'u';
        if (is_vowel && !in_group)
            ++groups;
        in_group = is_vowel;
    }
    return std::max(1, groups);
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

}  // namespace

std::optional<double> ContentCheck::readability_grade(const std::string& text) {
    auto words = split_words(text);
    if (words.size() < MIN_WORDS_FOR_GRADE)
        return std::nullopt;

    size_t      sentences = 0;
    std::string current;
    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            if (!is_blank(current))
                ++sentences;
            current.clear();
        }
        else {
            current += c;
        }
    }
    if (!is_blank(current))
        ++sentences;
    if (sentences == 0)
        sentences = 1;

    int syllables = 0;
    for (const auto& word : words)
        syllables += count_syllables(word);

    double n     = static_cast<double>(words.size());
    double grade = 0.39 * (n / static_cast<double>(sentences))
                   + 11.8 * (static_cast<double>(syllables) / n) - 15.59;
    return round1(grade);
}

double ContentCheck::answer_first_ratio(const std::string& markdown) {
    auto sections = sections_of(markdown);
    if (sections.empty())
        return 0;

    static const std::regex sentence_end(R"([.!?]\s)");
    int                     answer_first = 0;
    for (const auto& section : sections) {
        std::smatch match;
        std::string first = section;
        if (std::regex_search(section, match, sentence_end))
            first = section.substr(0, static_cast<size_t>(match.position(0)) + 1);
        first = trim(first);
        if (!first.empty() && first.back() != '?')
            ++answer_first;
    }
    return round2(static_cast<double>(answer_first) / static_cast<double>(sections.size()));
}

Core::ContentReport ContentCheck::analyze(const std::string& markdown) {
    Core::ContentReport report;
    if (markdown.empty()) {
        report.summary = "No content extracted";
        return report;
    }

    report.word_count      = static_cast<int>(split_words(markdown).size());
    report.char_count      = static_cast<int>(char_length(markdown));
    report.has_code_blocks = markdown.find("```") != std::string::npos;

    int previous_level = 0;
    for (const auto& line : split_lines(markdown)) {
        std::smatch match;
        if (std::regex_search(line, match, heading_pattern())) {
            int level = static_cast<int>(match[1].length());
            if (report.heading_count > 0 && level > previous_level + 1)
                report.heading_hierarchy_valid = false;
            previous_level = level;
            ++report.heading_count;
        }
        else if (std::regex_search(line, list_pattern())) {
            report.has_lists = true;
        }
    }
    report.has_headings = report.heading_count > 0;

    auto sections      = sections_of(markdown);
    report.chunk_count = static_cast<int>(sections.size());
    int total_words    = 0;
    for (const auto& section : sections) {
        int words = static_cast<int>(split_words(section).size());
        total_words += words;
        if (words >= SWEET_SPOT_MIN && words <= SWEET_SPOT_MAX)
            ++report.chunks_in_sweet_spot;
    }
    if (report.chunk_count > 0)
        report.avg_chunk_words = total_words / report.chunk_count;

    report.readability_grade  = readability_grade(markdown);
    report.answer_first_ratio = answer_first_ratio(markdown);

    report.score = Engine::Scoring::score_content(
        report.word_count, report.has_headings, report.has_lists, report.has_code_blocks);

    report.summary = std::to_string(report.word_count) + " words";
    if (report.has_headings)
        report.summary += ", has headings";
    if (report.has_lists)
        report.summary += ", has lists";
    if (report.has_code_blocks)
        report.summary += ", has code blocks";
    return report;
}

}  // namespace Checks
}  // namespace Sightline
