#include <gtest/gtest.h>
#include "../../src/utils/sitemap/sitemap.hpp"

using namespace Sightline::Utils;

TEST(SitemapTest, UrlSetWithNamespace) {
    std::string xml = R"xml(<?xml version="1.0" encoding="UTF-8"?>
<urlset xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
  <url><loc>https://example.com/</loc><lastmod>2024-01-01</lastmod></url>
  <url><loc>
      https://example.com/blog/first-post
  </loc></url>
  <url><priority>0.5</priority></url>
</urlset>)xml";

    auto entries = Sitemap::parse(xml);
    ASSERT_EQ(entries.pages.size(), 2);
    EXPECT_EQ(entries.pages[0], "https://example.com/");
    EXPECT_EQ(entries.pages[1], "https://example.com/blog/first-post");
    EXPECT_TRUE(entries.sitemaps.empty());
}

TEST(SitemapTest, SitemapIndex) {
    std::string xml = R"xml(<?xml version="1.0" encoding="UTF-8"?>
<sitemapindex xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
  <sitemap><loc>https://example.com/sitemap-posts.xml</loc></sitemap>
  <sitemap><loc>https://example.com/sitemap-pages.xml</loc></sitemap>
</sitemapindex>)xml";

    auto entries = Sitemap::parse(xml);
    EXPECT_TRUE(entries.pages.empty());
    ASSERT_EQ(entries.sitemaps.size(), 2);
    EXPECT_EQ(entries.sitemaps[1], "https://example.com/sitemap-pages.xml");
}

TEST(SitemapTest, PrefixedElementsMatchByLocalName) {
    std::string xml = R"xml(<sm:urlset xmlns:sm="http://www.sitemaps.org/schemas/sitemap/0.9">
  <sm:url><sm:loc>https://example.com/a</sm:loc></sm:url>
</sm:urlset>)xml";

    auto entries = Sitemap::parse(xml);
    ASSERT_EQ(entries.pages.size(), 1);
    EXPECT_EQ(entries.pages[0], "https://example.com/a");
}

TEST(SitemapTest, GarbageYieldsNothing) {
    EXPECT_TRUE(Sitemap::parse("").pages.empty());
    EXPECT_TRUE(Sitemap::parse("<html><body>Not found</body></html>").pages.empty());
    EXPECT_TRUE(Sitemap::parse("\x01\x02 not xml at all").pages.empty());
}

TEST(SitemapTest, TruncatedXmlRecoversEarlierEntries) {
    std::string xml =
        "<urlset><url><loc>https://example.com/one</loc></url>"
        "<url><loc>https://example.com/two</loc></url><url><loc>https://exa";

    auto entries = Sitemap::parse(xml);
    ASSERT_GE(entries.pages.size(), 2);
    EXPECT_EQ(entries.pages[0], "https://example.com/one");
}
