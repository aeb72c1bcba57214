#include <gtest/gtest.h>
#include "../../src/checks/content/content_check.hpp"

using namespace Sightline::Checks;

namespace {

std::string words(int n, const std::string& word = "lorem") {
    std::string out;
    for (int i = 0; i < n; ++i) {
        if (i > 0)
            out += ' ';
        out += word;
    }
    return out;
}

}  // namespace

TEST(ContentCheckTest, EmptyMarkdown) {
    auto report = ContentCheck::analyze("");
    EXPECT_EQ(report.word_count, 0);
    EXPECT_EQ(report.score, 0);
    EXPECT_EQ(report.summary, "No content extracted");
    EXPECT_FALSE(report.readability_grade.has_value());
}

TEST(ContentCheckTest, CountsWordsAndChars) {
    std::string md     = "Plain text with five words\n";
    auto        report = ContentCheck::analyze(md);
    EXPECT_EQ(report.word_count, 5);
    EXPECT_EQ(report.char_count, static_cast<int>(md.size()));
    EXPECT_FALSE(report.has_headings);
    EXPECT_FALSE(report.has_lists);
    EXPECT_FALSE(report.has_code_blocks);
    EXPECT_EQ(report.summary, "5 words");
}

TEST(ContentCheckTest, CharCountIsInCharacters) {
    std::string md;
    for (int i = 0; i < 10; ++i)
        md += "\xC3\xA9";
    md += "\n";
    auto report = ContentCheck::analyze(md);
    EXPECT_EQ(report.char_count, 11);
    EXPECT_EQ(report.word_count, 1);

    auto cjk = ContentCheck::analyze("\xE6\x97\xA5\xE6\x9C\xAC \xE8\xAA\x9E\n");
    EXPECT_EQ(cjk.char_count, 5);
    EXPECT_EQ(cjk.word_count, 2);
}

TEST(ContentCheckTest, DetectsStructure) {
    std::string md =
        "# Guide\n\n"
        "Intro text.\n\n"
        "## Steps\n\n"
        "- first\n"
        "* second\n"
        "  + nested\n\n"
        "```\nmake install\n```\n";

    auto report = ContentCheck::analyze(md);
    EXPECT_TRUE(report.has_headings);
    EXPECT_TRUE(report.has_lists);
    EXPECT_TRUE(report.has_code_blocks);
    EXPECT_EQ(report.heading_count, 2);
    EXPECT_TRUE(report.heading_hierarchy_valid);
    EXPECT_NE(report.summary.find("has headings, has lists, has code blocks"), std::string::npos);
}

TEST(ContentCheckTest, EmphasisAndRulesAreNotLists) {
    auto report = ContentCheck::analyze("**bold** start\n\n---\n\n-dash without space\n");
    EXPECT_FALSE(report.has_lists);
}

TEST(ContentCheckTest, HeadingNeedsSpaceAfterHashes) {
    auto report = ContentCheck::analyze("#hashtag\n####### seven\n");
    EXPECT_FALSE(report.has_headings);
    EXPECT_EQ(report.heading_count, 0);
}

TEST(ContentCheckTest, SkippedHeadingLevelBreaksHierarchy) {
    EXPECT_FALSE(ContentCheck::analyze("# Top\n\n### Skipped\n").heading_hierarchy_valid);
    EXPECT_TRUE(ContentCheck::analyze("## Start\n\n# Up\n\n## Down\n").heading_hierarchy_valid);
}

TEST(ContentCheckTest, ChunksBetweenHeadings) {
    std::string md = words(3) + "\n\n# One\n\n" + words(60) + "\n\n## Two\n\n" + words(4) + "\n\n## Empty\n";

    auto report = ContentCheck::analyze(md);
    EXPECT_EQ(report.chunk_count, 3);
    EXPECT_EQ(report.chunks_in_sweet_spot, 1);
    EXPECT_EQ(report.avg_chunk_words, 67 / 3);
}

TEST(ContentCheckTest, ReadabilityGrade) {
    EXPECT_FALSE(ContentCheck::readability_grade(words(29, "cat")).has_value());

    // 30 one-syllable words, one sentence: 0.39 * 30 + 11.8 * 1 - 15.59
    auto grade = ContentCheck::readability_grade(words(30, "cat"));
    ASSERT_TRUE(grade.has_value());
    EXPECT_DOUBLE_EQ(*grade, 7.9);
}

TEST(ContentCheckTest, AnswerFirstRatio) {
    std::string md =
        "# What is it\n\n"
        "What is a widget? It is a small part.\n\n"
        "# Details\n\n"
        "A widget is a part. It fits.\n";
    EXPECT_DOUBLE_EQ(ContentCheck::answer_first_ratio(md), 0.5);
    EXPECT_DOUBLE_EQ(ContentCheck::answer_first_ratio(""), 0.0);
}

TEST(ContentCheckTest, ScoreFollowsTiers) {
    std::string md = "# Title\n\n" + words(900) + "\n\n- item one\n- item two\n";
    auto        report = ContentCheck::analyze(md);
    EXPECT_GE(report.word_count, 800);
    EXPECT_LT(report.word_count, 1500);
    EXPECT_DOUBLE_EQ(report.score, 32.0);
}
