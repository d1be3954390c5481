#include "ContentParser.h"
#include "../../include/Logger.h"
#include "../../include/linkguard/common/UrlNormalizer.h"
#include <algorithm>
#include <set>
#include <sstream>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kSkipSchemes = {"tel", "javascript", "data"};

const char* const kChromeClasses[] = {"site-header", "site-footer", "global-nav"};

} // namespace

HtmlDocument::HtmlDocument(const std::string& html)
    : output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
    if (!output) {
        LOG_ERROR("Failed to parse HTML with Gumbo");
    }
}

const GumboNode* HtmlDocument::root() const {
    return output ? output->root : nullptr;
}

void HtmlDocument::OutputDeleter::operator()(GumboOutput* out) const {
    if (out) {
        gumbo_destroy_output(&kGumboDefaultOptions, out);
    }
}

ContentParser::ContentParser() {
    LOG_TRACE("ContentParser constructor called");
}

ContentParser::~ContentParser() {
    LOG_TRACE("ContentParser destructor called");
}

bool ContentParser::isElement(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string ContentParser::attributeValue(const GumboNode* node, const char* name) {
    if (!isElement(node)) {
        return "";
    }
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? std::string(attr->value) : std::string();
}

bool ContentParser::hasClass(const GumboNode* node, const std::string& className) {
    std::istringstream classes(attributeValue(node, "class"));
    std::string token;
    while (classes >> token) {
        if (token == className) {
            return true;
        }
    }
    return false;
}

bool ContentParser::isChromeElement(const GumboNode* node) {
    if (!isElement(node)) {
        return false;
    }
    switch (node->v.element.tag) {
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_ASIDE:
            return true;
        default:
            break;
    }
    for (const char* chromeClass : kChromeClasses) {
        if (hasClass(node, chromeClass)) {
            return true;
        }
    }
    return false;
}

const GumboNode* ContentParser::findFirst(const GumboNode* node, bool (*predicate)(const GumboNode*)) {
    if (!isElement(node) || isChromeElement(node)) {
        return nullptr;
    }
    if (predicate(node)) {
        return node;
    }
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* found = findFirst(static_cast<const GumboNode*>(children.data[i]), predicate);
        if (found) {
            return found;
        }
    }
    return nullptr;
}

const GumboNode* ContentParser::findMainRegion(const GumboNode* root) {
    if (const GumboNode* main = findFirst(root, [](const GumboNode* n) {
            return n->v.element.tag == GUMBO_TAG_MAIN;
        })) {
        return main;
    }
    if (const GumboNode* byId = findFirst(root, [](const GumboNode* n) {
            return attributeValue(n, "id") == "content";
        })) {
        return byId;
    }
    return findFirst(root, [](const GumboNode* n) {
        return hasClass(n, "content");
    });
}

void ContentParser::collectHrefs(const GumboNode* node, bool skipChrome, std::vector<std::string>& hrefs) const {
    if (!isElement(node)) {
        return;
    }
    if (skipChrome && isChromeElement(node)) {
        return;
    }

    if (node->v.element.tag == GUMBO_TAG_A) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            hrefs.emplace_back(href->value);
        }
    }

    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        collectHrefs(static_cast<const GumboNode*>(children.data[i]), skipChrome, hrefs);
    }
}

bool ContentParser::isAllowedHost(const std::string& host, const std::vector<std::string>& allowDomains) {
    return std::any_of(allowDomains.begin(), allowDomains.end(), [&](const std::string& domain) {
        return linkguard::common::hostMatchesSuffix(host, domain);
    });
}

ExtractedLinks ContentParser::extractInternalLinks(const std::string& pageUrl,
                                                   const std::string& html,
                                                   const std::vector<std::string>& allowDomains,
                                                   bool countDuplicates) {
    using namespace linkguard::common;

    ExtractedLinks result;
    HtmlDocument document(html);
    if (!document.root()) {
        return result;
    }

    const GumboNode* main = findMainRegion(document.root());
    const GumboNode* searchArea = main ? main : document.root();
    if (!main) {
        LOG_TRACE("No main content region on " + pageUrl + ", searching whole document");
    }

    std::vector<std::string> hrefs;
    collectHrefs(searchArea, true, hrefs);

    std::unordered_set<std::string> uniqueTargets;
    size_t occurrences = 0;

    for (const auto& raw : hrefs) {
        const std::string absolute = resolveUrl(pageUrl, sanitizeUrl(raw));
        const ParsedUrl parts = parseUrl(absolute);

        if (parts.scheme == "mailto") {
            const std::string email = toLower(sanitizeUrl(parts.path));
            size_t at = email.rfind('@');
            if (at != std::string::npos && isAllowedHost(email.substr(at + 1), allowDomains)) {
                const std::string target = "mailto:" + email;
                occurrences++;
                result.links.push_back(target);
                uniqueTargets.insert(target);
            }
            continue;
        }

        if (kSkipSchemes.count(parts.scheme)) {
            continue;
        }
        if (parts.scheme != "http" && parts.scheme != "https") {
            continue;
        }
        if (!isAllowedHost(extractHost(absolute), allowDomains)) {
            continue;
        }
        if (parts.path.empty()) {
            continue;
        }

        std::string normalized = parts.scheme + "://" + parts.netloc + parts.path;
        while (!normalized.empty() && normalized.back() == '/') {
            normalized.pop_back();
        }

        occurrences++;
        result.links.push_back(normalized);
        uniqueTargets.insert(normalized);
    }

    result.count = countDuplicates ? occurrences : uniqueTargets.size();
    LOG_DEBUG("Extracted " + std::to_string(result.links.size()) + " in-scope links from " + pageUrl +
              " (" + std::to_string(uniqueTargets.size()) + " distinct)");
    return result;
}

LinkPartition ContentParser::partitionLinks(const std::string& pageUrl,
                                            const std::string& html,
                                            const std::vector<std::string>& allowDomains) {
    using namespace linkguard::common;

    LinkPartition partition;
    HtmlDocument document(html);
    if (!document.root()) {
        return partition;
    }

    std::vector<std::string> hrefs;
    collectHrefs(document.root(), false, hrefs);

    std::set<std::string> internal;
    std::set<std::string> external;
    for (const auto& raw : hrefs) {
        const std::string absolute = resolveUrl(pageUrl, sanitizeUrl(raw));
        if (isAllowedHost(extractHost(absolute), allowDomains)) {
            internal.insert(absolute);
        } else {
            external.insert(absolute);
        }
    }

    partition.internal.assign(internal.begin(), internal.end());
    partition.external.assign(external.begin(), external.end());
    return partition;
}
