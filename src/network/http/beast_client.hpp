#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Sightline {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_timeout(std::chrono::seconds timeout) override;
    void set_user_agent(const std::string& user_agent) override;
    void set_max_redirects(int max_redirects);
    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::chrono::seconds      timeout_{Core::Constants::REQUEST_TIMEOUT_SECONDS};
    std::string               user_agent_ = Core::Constants::USER_AGENT;
    int                       max_redirects_ = Core::Constants::MAX_REDIRECTS;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};

    struct Target {
        std::string host;
        std::string port;
        std::string target;
        std::string host_header;
        std::string effective_url;
    };

    boost::asio::awaitable<Response> fetch_once(const std::string& url);
    boost::asio::awaitable<Response> perform_http_request(const Target& target);
    boost::asio::awaitable<Response> perform_https_request(const Target& target);

    boost::beast::http::request<boost::beast::http::empty_body>
    make_request(const Target& target) const;
    static Response
    to_response(const Target&                                                         target,
                boost::beast::http::response_parser<boost::beast::http::string_body>& parser);
};

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
