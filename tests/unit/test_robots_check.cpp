#include <gtest/gtest.h>
#include <memory>
#include "../../src/checks/robots/robots_check.hpp"
#include "../support/async.hpp"
#include "../support/fake_http_client.hpp"

using namespace Sightline;
using namespace Sightline::Checks;
using Sightline::Testing::FakeHttpClient;
using Sightline::Testing::FakeSite;
using Sightline::Testing::run_blocking;

TEST(RobotsCheckTest, RobotsUrlUsesOrigin) {
    EXPECT_EQ(RobotsCheck::robots_url("https://Example.com/blog/post?x=1"),
              "https://example.com/robots.txt");
    EXPECT_EQ(RobotsCheck::robots_url("http://localhost:8080/a"), "http://localhost:8080/robots.txt");
}

TEST(RobotsCheckTest, ThreeNamedAgentsBlocked) {
    std::string txt =
        "User-agent: GPTBot\nDisallow: /\n\n"
        "User-agent: ClaudeBot\nDisallow: /\n\n"
        "User-agent: Bytespider\nDisallow: /\n\n"
        "User-agent: *\nAllow: /\n";

    auto report = RobotsCheck::evaluate(txt, {});
    ASSERT_EQ(report.agents.size(), 13);
    EXPECT_TRUE(report.found);
    EXPECT_EQ(report.allowed_count(), 10);
    EXPECT_DOUBLE_EQ(report.score, 19.2);
    EXPECT_EQ(report.summary, "10/13 AI bots allowed");

    for (const auto& agent : report.agents) {
        bool blocked = agent.name == "GPTBot" || agent.name == "ClaudeBot" || agent.name == "ByteSpider";
        EXPECT_EQ(agent.allowed, !blocked) << agent.name;
        EXPECT_EQ(agent.reason, blocked ? "Blocked by robots.txt" : "Allowed") << agent.name;
    }
}

TEST(RobotsCheckTest, AgentWithDigitInNameCanBeBlocked) {
    auto report = RobotsCheck::evaluate("User-agent: AI2Bot\nDisallow: /\n", {});
    ASSERT_EQ(report.agents.size(), 13);
    EXPECT_EQ(report.allowed_count(), 12);
    EXPECT_DOUBLE_EQ(report.score, 23.1);
    EXPECT_EQ(report.summary, "12/13 AI bots allowed");

    for (const auto& agent : report.agents)
        EXPECT_EQ(agent.allowed, agent.name != "AI2Bot") << agent.name;
}

TEST(RobotsCheckTest, WildcardBlockAppliesToAll) {
    auto report = RobotsCheck::evaluate("User-agent: *\nDisallow: /\n", {"GPTBot", "PerplexityBot"});
    EXPECT_EQ(report.allowed_count(), 0);
    EXPECT_EQ(report.score, 0);
    EXPECT_EQ(report.summary, "0/2 AI bots allowed");
}

TEST(RobotsCheckTest, PartialDisallowStillAllowsRoot) {
    auto report = RobotsCheck::evaluate("User-agent: GPTBot\nDisallow: /private/\n", {"GPTBot"});
    EXPECT_TRUE(report.agents[0].allowed);
    EXPECT_DOUBLE_EQ(report.score, 25.0);
}

TEST(RobotsCheckTest, FetchedWith200) {
    auto site = std::make_shared<FakeSite>();
    site->page("https://example.com/robots.txt", "User-agent: *\nDisallow:\n");
    FakeHttpClient client(site);

    auto outcome = run_blocking(RobotsCheck::run(client, "https://example.com/page", {"GPTBot"}));
    EXPECT_TRUE(outcome.report.found);
    ASSERT_TRUE(outcome.raw.has_value());
    EXPECT_EQ(*outcome.raw, "User-agent: *\nDisallow:\n");
    EXPECT_DOUBLE_EQ(outcome.report.score, 25.0);
}

TEST(RobotsCheckTest, MissingRobotsIsNotFound) {
    auto           site = std::make_shared<FakeSite>();
    FakeHttpClient client(site);

    auto outcome = run_blocking(RobotsCheck::run(client, "https://example.com/", {}));
    EXPECT_FALSE(outcome.report.found);
    EXPECT_FALSE(outcome.raw.has_value());
    EXPECT_TRUE(outcome.report.agents.empty());
    EXPECT_EQ(outcome.report.score, 0);
    EXPECT_EQ(outcome.report.summary, "robots.txt returned HTTP 404");
}

TEST(RobotsCheckTest, NetworkFailure) {
    auto site = std::make_shared<FakeSite>();
    site->unreachable("https://example.com/robots.txt");
    FakeHttpClient client(site);

    auto outcome = run_blocking(RobotsCheck::run(client, "https://example.com/", {}));
    EXPECT_FALSE(outcome.report.found);
    EXPECT_EQ(outcome.report.summary, "Failed to fetch robots.txt: Connection refused");
}
