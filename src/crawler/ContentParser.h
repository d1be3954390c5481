#pragma once

#include <string>
#include <vector>
#include <memory>
#include <gumbo.h>

struct ExtractedLinks {
    // Normalized in-scope targets in document order, duplicates kept
    std::vector<std::string> links;
    // Occurrences, or distinct targets when duplicates are not counted
    size_t count = 0;
};

struct LinkPartition {
    std::vector<std::string> internal;
    std::vector<std::string> external;
};

// Owns a parsed gumbo tree
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);

    const GumboNode* root() const;

private:
    struct OutputDeleter {
        void operator()(GumboOutput* output) const;
    };
    std::unique_ptr<GumboOutput, OutputDeleter> output;
};

class ContentParser {
public:
    ContentParser();
    ~ContentParser();

    // In-scope links of the page's main content region. Site chrome (header,
    // nav, footer, aside, .site-header, .site-footer, .global-nav) never counts.
    ExtractedLinks extractInternalLinks(const std::string& pageUrl,
                                        const std::string& html,
                                        const std::vector<std::string>& allowDomains,
                                        bool countDuplicates = true);

    // Every link of the document resolved and split by the allow-list, sorted
    // and de-duplicated
    LinkPartition partitionLinks(const std::string& pageUrl,
                                 const std::string& html,
                                 const std::vector<std::string>& allowDomains);

    // First of: <main>, #content, .content outside site chrome; nullptr if none
    static const GumboNode* findMainRegion(const GumboNode* root);

    static bool isChromeElement(const GumboNode* node);

private:
    // Collect href values below node, optionally skipping chrome subtrees
    void collectHrefs(const GumboNode* node, bool skipChrome, std::vector<std::string>& hrefs) const;

    static const GumboNode* findFirst(const GumboNode* node, bool (*predicate)(const GumboNode*));

    static bool isElement(const GumboNode* node);
    static bool hasClass(const GumboNode* node, const std::string& className);
    static std::string attributeValue(const GumboNode* node, const char* name);

    static bool isAllowedHost(const std::string& host, const std::vector<std::string>& allowDomains);
};
