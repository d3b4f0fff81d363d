#pragma once
#include <string>

namespace Arachne {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;  // Without the leading '?'
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static std::string strip_fragment(const std::string& url);
    static bool        is_http(const std::string& url);
};

}  // namespace Utils
}  // namespace Arachne
