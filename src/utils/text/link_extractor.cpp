#include "link_extractor.hpp"
#include <gumbo.h>
#include <unordered_set>
#include "../url/url.hpp"

namespace Arachne {
namespace Utils {
namespace Text {

namespace {

void collect_links(GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            links.emplace_back(href->value);
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<GumboNode*>(children->data[i]), links);
    }
}

}  // namespace

std::vector<std::string> LinkExtractor::extract(const std::string& html) {
    std::vector<std::string> links;
    if (html.empty())
        return links;

    GumboOutput* output = gumbo_parse(html.c_str());
    collect_links(output->root, links);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return links;
}

std::vector<std::string> LinkExtractor::extract_resolved(const std::string& base_url,
                                                         const std::string& html) {
    std::vector<std::string>        resolved;
    std::unordered_set<std::string> seen;

    for (const auto& href : extract(html)) {
        std::string absolute = Url::resolve(base_url, href);
        if (!Url::is_http(absolute))
            continue;
        if (seen.insert(absolute).second)
            resolved.push_back(std::move(absolute));
    }
    return resolved;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Arachne
