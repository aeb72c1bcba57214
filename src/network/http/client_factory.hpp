#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "http_client.hpp"

namespace Sightline {
namespace Network {
namespace Http {

// "beast" or "curl". Throws std::runtime_error for anything else.
std::unique_ptr<HttpClient> make_client(const std::string&   backend,
                                        std::chrono::seconds timeout,
                                        const std::string&   user_agent);

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
