#pragma once
#include <string>

namespace Sightline {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);

    // "{scheme}://{host[:port]}", empty when the URL has no host.
    static std::string origin(const std::string& url);
    static std::string host(const std::string& url);

    // Lowercases scheme and host, drops query, fragment and trailing slashes.
    // The root path stays "/".
    static std::string normalize(const std::string& url);
    static std::string strip_fragment(const std::string& url);

    // Number of non-empty path segments.
    static int         path_depth(const std::string& url);
    static std::string first_path_segment(const std::string& url);
};

}  // namespace Utils
}  // namespace Sightline
