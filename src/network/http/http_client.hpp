#pragma once

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace Sightline {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, InvalidUrl, TooManyRedirects, Other };

enum class HTTPCode { NetworkError = 0, Ok = 200, NotFound = 404 };

enum class MaxCode { ClientError = 400 };

}  // namespace Http
}  // namespace Network
}  // namespace Sightline

namespace Sightline {

struct Response {
    std::string              effective_url;
    long                     status_code = 0;
    std::string              content_type;
    std::string              location;
    std::string              body;
    std::string              error;
    bool                     success    = false;
    Network::Http::ErrorType error_type = Network::Http::ErrorType::None;

    bool is_ok() const {
        return status_code == static_cast<long>(Network::Http::HTTPCode::Ok);
    }
};

namespace Network {
namespace Http {

// Timed GET with redirect following. Failures are reported through the
// Response, never thrown. Implementations must tolerate concurrent get()
// calls from coroutines sharing one executor.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_timeout(std::chrono::seconds timeout)       = 0;
    virtual void set_user_agent(const std::string& user_agent)   = 0;
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

inline bool is_redirect(long status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 || status_code == 307
           || status_code == 308;
}

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
