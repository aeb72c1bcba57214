#pragma once
#include <atomic>
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/thread_pool.hpp>
#include <curl/curl.h>
#include <memory>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Sightline {
namespace Network {
namespace Http {

// Blocking libcurl transfers run on a private worker pool; get() resumes on the
// caller's executor. Destroying the client aborts transfers still in flight.
class CurlClient : public HttpClient {
public:
    explicit CurlClient(int worker_threads = Core::Constants::CURL_WORKER_THREADS);
    ~CurlClient() override;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_timeout(std::chrono::seconds timeout) override;
    void set_user_agent(const std::string& user_agent) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

    // Synchronous transfer on the calling thread.
    Response perform_get(const std::string& url) const;

private:
    struct Request {
        std::string url;
        long        timeout_seconds = Core::Constants::REQUEST_TIMEOUT_SECONDS;
        long        max_redirects   = Core::Constants::MAX_REDIRECTS;
        std::string user_agent      = Core::Constants::USER_AGENT;
    };

    struct RequestContext {
        std::string*             body         = nullptr;
        std::string*             content_type = nullptr;
        const std::atomic<bool>* cancelled    = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    long                     timeout_seconds_ = Core::Constants::REQUEST_TIMEOUT_SECONDS;
    std::string              user_agent_      = Core::Constants::USER_AGENT;
    std::atomic<bool>        cancelled_{false};
    boost::asio::thread_pool pool_;

    Request  create_request(const std::string& url) const;
    Response perform(const Request& req) const;
    Response create_error_response(const std::string& url, const std::string& msg) const;
    void     setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const;
    boost::asio::awaitable<Response> run_on_pool(Request req);

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int    progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t);
};

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
