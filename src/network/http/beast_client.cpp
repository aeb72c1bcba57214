#include "beast_client.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Sightline {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Core::Logger;

namespace {
constexpr int SHUTDOWN_TIMEOUT_SECONDS = 2;

Response error_response(const std::string& url, ErrorType type, const std::string& message) {
    Response response;
    response.effective_url = url;
    response.status_code   = static_cast<long>(HTTPCode::NetworkError);
    response.success       = false;
    response.error         = message;
    response.error_type    = type;
    return response;
}
}  // namespace

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_timeout(std::chrono::seconds timeout) {
    timeout_ = timeout;
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void BeastClient::set_max_redirects(int max_redirects) {
    max_redirects_ = max_redirects;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    std::string current = url;
    for (int hop = 0; hop <= max_redirects_; ++hop) {
        Response res = co_await fetch_once(current);
        if (!is_redirect(res.status_code) || res.location.empty())
            co_return res;

        std::string next = Utils::Url::resolve(current, res.location);
        if (next.empty())
            co_return res;

        Logger::debug("Redirect " + std::to_string(res.status_code) + ": " + current + " -> "
                      + next);
        current = std::move(next);
    }
    co_return error_response(current, ErrorType::TooManyRedirects, "Too many redirects");
}

net::awaitable<Response> BeastClient::fetch_once(const std::string& url) {
    auto parsed = Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        co_return error_response(url, ErrorType::InvalidUrl, "Invalid URL: " + url);
    }

    bool   is_ssl = (parsed.scheme == "https");
    Target target;
    target.host          = parsed.host;
    target.port          = parsed.port.empty() ? (is_ssl ? "443" : "80") : parsed.port;
    target.target        = parsed.path.empty() ? "/" : parsed.path;
    target.host_header   = parsed.port.empty() ? parsed.host : parsed.host + ":" + parsed.port;
    target.effective_url = url;
    if (!parsed.query.empty())
        target.target += "?" + parsed.query;

    try {
        if (is_ssl)
            co_return co_await perform_https_request(target);
        co_return co_await perform_http_request(target);
    } catch (const beast::system_error& e) {
        if (e.code() == beast::error::timeout)
            co_return error_response(url, ErrorType::Timeout, "Timed out: " + url);
        co_return error_response(url, ErrorType::Network, e.code().message());
    } catch (const std::exception& e) {
        co_return error_response(url, ErrorType::Other, e.what());
    }
}

http::request<http::empty_body> BeastClient::make_request(const Target& target) const {
    http::request<http::empty_body> req{http::verb::get, target.target, 11};
    req.set(http::field::host, target.host_header);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/html,application/xhtml+xml,application/xml,text/plain,*/*");
    return req;
}

Response BeastClient::to_response(const Target&                             target,
                                  http::response_parser<http::string_body>& parser) {
    auto res = parser.release();

    Response response;
    response.effective_url = target.effective_url;
    response.status_code   = res.result_int();
    response.body          = std::move(res.body());
    response.success       = response.status_code >= 200
                       && response.status_code < static_cast<long>(MaxCode::ClientError);

    auto ct = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    auto loc = res.find(http::field::location);
    if (loc != res.end())
        response.location = std::string(loc->value());

    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

net::awaitable<Response> BeastClient::perform_http_request(const Target& target) {
    auto executor = co_await net::this_coro::executor;

    tcp::resolver resolver(executor);
    auto          results =
        co_await resolver.async_resolve(target.host, target.port, net::use_awaitable);

    beast::tcp_stream stream(executor);
    stream.expires_after(timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(timeout_);
    auto req = make_request(target);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(Core::Constants::MAX_BODY_BYTES);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    Response response = to_response(target, parser);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Target& target) {
    auto executor = co_await net::this_coro::executor;

    tcp::resolver resolver(executor);
    auto          results =
        co_await resolver.async_resolve(target.host, target.port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), target.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(timeout_);
    auto req = make_request(target);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(Core::Constants::MAX_BODY_BYTES);
    co_await http::async_read(ssl_stream, buffer, parser, net::use_awaitable);

    Response response = to_response(target, parser);

    // Servers routinely truncate instead of answering close_notify; the body is already read.
    beast::get_lowest_layer(ssl_stream)
        .expires_after(std::chrono::seconds(SHUTDOWN_TIMEOUT_SECONDS));
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
