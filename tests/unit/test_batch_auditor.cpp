#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/batch/batch_auditor.hpp"
#include "../support/fake_http_client.hpp"

using namespace Sightline;
using namespace Sightline::Engine;
using Sightline::Testing::FakeHttpClient;
using Sightline::Testing::FakeSite;
using namespace std::chrono_literals;

namespace {

AuditOptions fast_options() {
    AuditOptions options;
    options.crawl_delay  = 0;
    options.deadline     = 10s;
    options.shuffle_seed = 3;
    return options;
}

}  // namespace

class BatchAuditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_ERROR);
    }
    void TearDown() override {
        Core::Logger::set_level(Core::LOG_DEFAULT);
    }
};

TEST_F(BatchAuditorTest, ResultsKeepInputOrder) {
    auto site = std::make_shared<FakeSite>();
    site->slow("https://slow.example/", "<html><body><p>slow</p></body></html>", 150ms);
    site->page("https://fast.example/", "<html><body><p>fast</p></body></html>");
    site->page("https://llms.example/", "<html><body><p>hi</p></body></html>");
    site->page("https://llms.example/llms.txt", "# llms\n");

    Auditor      auditor(fast_options(), [site] { return std::make_unique<FakeHttpClient>(site); });
    BatchAuditor batch(auditor, 2);

    std::vector<std::string> urls = {
        "https://slow.example/", "https://fast.example/", "https://llms.example/"};
    auto reports = batch.audit_sites(urls);

    ASSERT_EQ(reports.size(), 3);
    for (size_t i = 0; i < urls.size(); ++i)
        EXPECT_EQ(reports[i].url, urls[i]);
    EXPECT_EQ(reports[0].domain, "slow.example");
    EXPECT_DOUBLE_EQ(reports[2].context_file.score, 10.0);
    EXPECT_EQ(reports[0].context_file.score, 0);
}

TEST_F(BatchAuditorTest, SinglePageMode) {
    auto site = std::make_shared<FakeSite>();
    site->page("https://a.example/x", "<html><body><p>x</p></body></html>");

    Auditor      auditor(fast_options(), [site] { return std::make_unique<FakeHttpClient>(site); });
    BatchAuditor batch(auditor, 4);

    auto reports = batch.audit_urls({"https://a.example/x", "https://b.example/y"});
    ASSERT_EQ(reports.size(), 2);
    EXPECT_TRUE(reports[0].errors.empty());
    ASSERT_EQ(reports[1].errors.size(), 1);
    EXPECT_EQ(reports[1].errors[0], "Crawl error: HTTP 404");
}

TEST_F(BatchAuditorTest, AuditExceptionBecomesReport) {
    Auditor auditor(fast_options(), []() -> std::unique_ptr<Network::Http::HttpClient> {
        throw std::runtime_error("no client");
    });
    BatchAuditor batch(auditor, 2);

    auto reports = batch.audit_sites({"https://a.example/", "https://b.example/"});
    ASSERT_EQ(reports.size(), 2);
    EXPECT_EQ(reports[1].url, "https://b.example/");
    ASSERT_EQ(reports[1].errors.size(), 1);
    EXPECT_EQ(reports[1].errors[0], "Audit failed: no client");
    EXPECT_EQ(reports[1].overall_score, 0);
}

TEST_F(BatchAuditorTest, EmptyInput) {
    auto         site = std::make_shared<FakeSite>();
    Auditor      auditor(fast_options(), [site] { return std::make_unique<FakeHttpClient>(site); });
    BatchAuditor batch(auditor, 0);
    EXPECT_TRUE(batch.audit_sites({}).empty());
}
