#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

namespace Arachne {
namespace Utils {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// A scheme is present only if ':' comes before any of "/?#".
size_t scheme_end(std::string_view sv) {
    size_t colon = sv.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return std::string_view::npos;
    size_t delim = sv.find_first_of("/?#");
    if (delim != std::string_view::npos && delim < colon)
        return std::string_view::npos;
    return colon;
}

std::string authority_of(const UrlParsed& p) {
    return p.port.empty() ? p.host : p.host + ":" + p.port;
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string out = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0)
            out += "/";
        out += segments[i];
    }

    bool trailing = path.size() > 1
                    && (path.back() == '/' || path.compare(path.size() - 2, 2, "/.") == 0
                        || (path.size() > 2 && path.compare(path.size() - 3, 3, "/..") == 0));
    if (trailing && out.back() != '/')
        out += "/";
    return out;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed        parsed;
    std::string_view sv = url;

    size_t colon = scheme_end(sv);
    if (colon != std::string_view::npos) {
        parsed.scheme = to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.substr(0, 2) == "//") {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = end_auth == std::string_view::npos ? std::string_view{} : sv.substr(end_auth);

        size_t at = authority.find_last_of('@');
        if (at != std::string::npos)
            authority = authority.substr(at + 1);

        size_t port_colon = authority.find_last_of(':');
        size_t bracket    = authority.find(']');
        if (port_colon != std::string::npos
            && (bracket == std::string::npos || port_colon > bracket)) {
            parsed.host = authority.substr(0, port_colon);
            parsed.port = authority.substr(port_colon + 1);
        }
        else {
            parsed.host = authority;
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos)
        sv = sv.substr(0, h_pos);

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
    std::string ref = strip_fragment(relative);
    if (ref.empty())
        return strip_fragment(base);

    if (scheme_end(ref) != std::string::npos)
        return ref;

    UrlParsed b = parse(base);

    if (ref.compare(0, 2, "//") == 0)
        return b.scheme + ":" + ref;

    std::string prefix = b.scheme + "://" + authority_of(b);

    if (ref[0] == '?')
        return prefix + b.path + ref;

    std::string path;
    std::string query;
    size_t      q = ref.find('?');
    if (q != std::string::npos) {
        query = ref.substr(q);
        ref   = ref.substr(0, q);
    }

    if (ref[0] == '/') {
        path = ref;
    }
    else {
        size_t last_slash = b.path.find_last_of('/');
        path = (last_slash == std::string::npos ? "/" : b.path.substr(0, last_slash + 1)) + ref;
    }

    return prefix + remove_dot_segments(path) + query;
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

bool Url::is_http(const std::string& url) {
    UrlParsed p = parse(url);
    return (p.scheme == "http" || p.scheme == "https") && !p.host.empty();
}

}  // namespace Utils
}  // namespace Arachne
