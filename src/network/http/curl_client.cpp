#include "curl_client.hpp"
#include <algorithm>
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <string_view>
#include "../../core/logger/logger.hpp"

namespace Sightline {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL: return ErrorType::InvalidUrl;
        case CURLE_TOO_MANY_REDIRECTS: return ErrorType::TooManyRedirects;
        default: return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    if (ctx->body->size() + total > Core::Constants::MAX_BODY_BYTES)
        return 0;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*  ctx   = static_cast<CurlClient::RequestContext*>(userp);
    size_t total = size * nitems;
    if (!ctx || !ctx->content_type)
        return total;

    std::string_view header(buffer, total);
    // Redirect hops each send headers; the last Content-Type wins.
    if (istarts_with(header, CONTENT_TYPE_HEADER)) {
        *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    }
    return total;
}

int CurlClient::progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    return (ctx && ctx->cancelled && ctx->cancelled->load()) ? 1 : 0;
}

CurlClient::CurlClient(int worker_threads)
    : pool_(static_cast<std::size_t>(std::max(1, worker_threads))) {
}

CurlClient::~CurlClient() {
    cancelled_ = true;
    pool_.stop();
    pool_.join();
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    timeout_seconds_ = static_cast<long>(timeout.count());
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

CurlClient::Request CurlClient::create_request(const std::string& url) const {
    Request req;
    req.url             = url;
    req.timeout_seconds = timeout_seconds_;
    req.user_agent      = user_agent_;
    return req;
}

Response CurlClient::create_error_response(const std::string& url, const std::string& msg) const {
    Response r;
    r.effective_url = url;
    r.success       = false;
    r.error         = msg;
    r.error_type    = ErrorType::Network;
    r.status_code   = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const {
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, req.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());
}

Response CurlClient::perform(const Request& req) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        return create_error_response(req.url, "Failed to initialize CURL handle");

    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type, &cancelled_};
    setup_curl_options(curl.get(), req, ctx);

    CURLcode code          = curl_easy_perform(curl.get());
    long     response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &eff_url_ptr);

    Response response;
    response.effective_url = eff_url_ptr ? std::string(eff_url_ptr) : req.url;

    if (code != CURLE_OK) {
        response.error       = curl_easy_strerror(code);
        response.error_type  = map_curl_code_to_error_type(code);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.status_code  = response_code;
    response.content_type = std::move(content_type);
    response.body         = std::move(body);
    response.success      = response.status_code >= 200
                       && response.status_code < static_cast<long>(MaxCode::ClientError);
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

Response CurlClient::perform_get(const std::string& url) const {
    return perform(create_request(url));
}

boost::asio::awaitable<Response> CurlClient::run_on_pool(Request req) {
    co_return perform(req);
}

boost::asio::awaitable<Response> CurlClient::get(const std::string& url) {
    Core::Logger::debug("curl GET " + url);
    co_return co_await boost::asio::co_spawn(
        pool_, run_on_pool(create_request(url)), boost::asio::use_awaitable);
}

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
