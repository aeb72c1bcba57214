#include <gtest/gtest.h>
#include "../../src/engine/scoring/scoring.hpp"

using namespace Sightline::Core;
using namespace Sightline::Engine::Scoring;

namespace {

std::vector<SchemaEntity> entities_of(const std::vector<std::string>& types) {
    std::vector<SchemaEntity> entities;
    for (const auto& type : types)
        entities.push_back({type, {}});
    return entities;
}

}  // namespace

TEST(ScoringTest, RobotsProportional) {
    EXPECT_DOUBLE_EQ(score_robots(13, 13), 25.0);
    EXPECT_DOUBLE_EQ(score_robots(10, 13), 19.2);
    EXPECT_DOUBLE_EQ(score_robots(0, 13), 0.0);
    EXPECT_DOUBLE_EQ(score_robots(0, 0), 0.0);
}

TEST(ScoringTest, ContextFileAllOrNothing) {
    EXPECT_DOUBLE_EQ(score_context_file(true), 10.0);
    EXPECT_DOUBLE_EQ(score_context_file(false), 0.0);
}

TEST(ScoringTest, StructuredDataByUniqueType) {
    EXPECT_DOUBLE_EQ(score_structured_data({}), 0.0);
    EXPECT_DOUBLE_EQ(score_structured_data(entities_of({"Article"})), 13.0);
    EXPECT_DOUBLE_EQ(score_structured_data(entities_of({"Organization"})), 11.0);
    EXPECT_DOUBLE_EQ(score_structured_data(entities_of({"Article", "Article", "Article"})), 13.0);
    EXPECT_DOUBLE_EQ(score_structured_data(entities_of({"Article", "Organization"})), 16.0);
}

TEST(ScoringTest, StructuredDataCapped) {
    auto all = entities_of({"FAQPage", "HowTo", "Article", "Product", "Recipe", "BreadcrumbList"});
    EXPECT_DOUBLE_EQ(score_structured_data(all), 25.0);
}

TEST(ScoringTest, ContentTiers) {
    EXPECT_DOUBLE_EQ(score_content(0, false, false, false), 0.0);
    EXPECT_DOUBLE_EQ(score_content(149, false, false, false), 0.0);
    EXPECT_DOUBLE_EQ(score_content(150, false, false, false), 8.0);
    EXPECT_DOUBLE_EQ(score_content(400, false, false, false), 15.0);
    EXPECT_DOUBLE_EQ(score_content(799, false, false, false), 15.0);
    EXPECT_DOUBLE_EQ(score_content(800, false, false, false), 20.0);
    EXPECT_DOUBLE_EQ(score_content(1500, false, false, false), 25.0);
}

TEST(ScoringTest, ContentBonusesAndCap) {
    EXPECT_DOUBLE_EQ(score_content(900, true, true, false), 32.0);
    EXPECT_DOUBLE_EQ(score_content(10, true, true, true), 15.0);
    EXPECT_DOUBLE_EQ(score_content(5000, true, true, true), 40.0);
}

TEST(ScoringTest, PillarMaximaSumToHundred) {
    EXPECT_DOUBLE_EQ(max_overall_score(), 100.0);
}
