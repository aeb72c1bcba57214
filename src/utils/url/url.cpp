#include "url.hpp"
#include <algorithm>
#include <sstream>
#include <vector>
#include "../text/string_utils.hpp"

namespace Sightline {
namespace Utils {

namespace {

std::string authority_of(const UrlParsed& p) {
    return p.port.empty() ? p.host : p.host + ":" + p.port;
}

std::vector<std::string> path_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty())
            segments.push_back(segment);
    }
    return segments;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = (end_auth != std::string_view::npos) ? sv.substr(end_auth) : std::string_view{};

        size_t      at        = authority.find_last_of('@');
        std::string host_port = (at != std::string::npos) ? authority.substr(at + 1) : authority;

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }
    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#')
        return strip_fragment(base) + relative;

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    // mailto:, javascript:, tel: and friends
    size_t colon_pos = relative.find(':');
    size_t slash_pos = relative.find('/');
    if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos))
        return "";

    UrlParsed base_parsed = parse(base);
    if (relative.size() >= 2 && relative[0] == '/' && relative[1] == '/')
        return base_parsed.scheme + ":" + relative;

    std::string result;
    if (relative[0] == '/') {
        result = base_parsed.scheme + "://" + authority_of(base_parsed) + relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        result = base_parsed.scheme + "://" + authority_of(base_parsed) + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = (scheme_end == std::string::npos) ? 0 : result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    std::vector<std::string> segments;
    for (const auto& segment : path_segments(path)) {
        if (segment == ".")
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized_path = "/" + Text::join(segments, "/");
    if (path.length() > 1 && path.back() == '/' && normalized_path.back() != '/')
        normalized_path += "/";

    return result.substr(0, domain_end) + normalized_path + query_frag;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    return host(url1) == host(url2);
}

std::string Url::host(const std::string& url) {
    std::string h = Text::to_lower(parse(url).host);
    if (!h.empty() && h.back() == '.')
        h.pop_back();
    return h;
}

std::string Url::origin(const std::string& url) {
    UrlParsed p = parse(url);
    if (p.host.empty())
        return "";
    std::string scheme = p.scheme.empty() ? "https" : Text::to_lower(p.scheme);
    return scheme + "://" + Text::to_lower(authority_of(p));
}

std::string Url::normalize(const std::string& url) {
    UrlParsed p = parse(url);
    if (p.host.empty())
        return url;

    std::string path = p.path;
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    return origin(url) + (path.empty() ? "/" : path);
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

int Url::path_depth(const std::string& url) {
    return static_cast<int>(path_segments(parse(url).path).size());
}

std::string Url::first_path_segment(const std::string& url) {
    auto segments = path_segments(parse(url).path);
    return segments.empty() ? "" : segments.front();
}

}  // namespace Utils
}  // namespace Sightline
