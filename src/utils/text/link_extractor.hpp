#pragma once
#include <string>
#include <vector>

namespace Arachne {
namespace Utils {
namespace Text {

class LinkExtractor {
public:
    // Raw href values of every <a> element, in document order.
    static std::vector<std::string> extract(const std::string& html);

    // Absolute http(s) links, fragments removed, first occurrence kept.
    static std::vector<std::string> extract_resolved(const std::string& base_url,
                                                     const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Arachne
