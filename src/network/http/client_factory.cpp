#include "client_factory.hpp"
#include <stdexcept>
#include "beast_client.hpp"
#include "curl_client.hpp"

namespace Sightline {
namespace Network {
namespace Http {

std::unique_ptr<HttpClient> make_client(const std::string&   backend,
                                        std::chrono::seconds timeout,
                                        const std::string&   user_agent) {
    std::unique_ptr<HttpClient> client;
    if (backend == "beast")
        client = std::make_unique<BeastClient>();
    else if (backend == "curl")
        client = std::make_unique<CurlClient>();
    else
        throw std::runtime_error("Unknown HTTP backend: " + backend);

    client->set_timeout(timeout);
    client->set_user_agent(user_agent);
    return client;
}

}  // namespace Http
}  // namespace Network
}  // namespace Sightline
