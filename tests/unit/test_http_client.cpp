#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "../../src/network/http/beast_client.hpp"
#include "../../src/network/http/client_factory.hpp"
#include "../../src/network/http/curl_client.hpp"
#include "../support/async.hpp"

using namespace Sightline::Network::Http;
using Sightline::Response;
using Sightline::Testing::run_blocking;

TEST(HttpClientTest, RealisticUserAgents) {
    CurlClient               client;
    std::vector<std::string> uas = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) Chrome/91.0.4472.124 Safari/537.36",
        "Sightline/0.1 (+https://github.com/sightline-audit)"};
    for (const auto& ua : uas) {
        client.set_user_agent(ua);
    }
}

TEST(HttpClientTest, FactoryBackends) {
    auto beast = make_client("beast", std::chrono::seconds(5), "UA");
    auto curl  = make_client("curl", std::chrono::seconds(5), "UA");
    EXPECT_NE(dynamic_cast<BeastClient*>(beast.get()), nullptr);
    EXPECT_NE(dynamic_cast<CurlClient*>(curl.get()), nullptr);
    EXPECT_THROW(make_client("wget", std::chrono::seconds(5), "UA"), std::runtime_error);
}

TEST(HttpClientTest, RedirectCodes) {
    for (long code : {301L, 302L, 303L, 307L, 308L})
        EXPECT_TRUE(is_redirect(code)) << code;
    for (long code : {200L, 304L, 404L, 0L})
        EXPECT_FALSE(is_redirect(code)) << code;
}

TEST(HttpClientTest, ResponseIsOkOnlyFor200) {
    Response res;
    EXPECT_FALSE(res.is_ok());
    res.status_code = 200;
    EXPECT_TRUE(res.is_ok());
    res.status_code = 204;
    EXPECT_FALSE(res.is_ok());
}

TEST(HttpClientTest, BeastRejectsUnsupportedScheme) {
    BeastClient client;
    Response    res = run_blocking(client.get("ftp://example.com/file.txt"));
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.status_code, 0);
    EXPECT_EQ(res.error_type, ErrorType::InvalidUrl);
    EXPECT_FALSE(res.error.empty());
}

TEST(HttpClientTest, CurlRejectsUnsupportedScheme) {
    CurlClient client(1);
    Response   res = client.perform_get("ftp://example.com/file.txt");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.status_code, 0);
    EXPECT_EQ(res.error_type, ErrorType::InvalidUrl);
}

TEST(HttpClientTest, CurlAwaitableResumesOnCaller) {
    CurlClient client(2);
    Response   res = run_blocking(client.get("ftp://example.com/file.txt"));
    EXPECT_EQ(res.error_type, ErrorType::InvalidUrl);
}
