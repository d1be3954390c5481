#pragma once

#include <string>
#include <vector>
#include <functional>
#include "models/CrawlResult.h"

class ViolationClassifier {
public:
    using LinkCheckFn = std::function<LinkCheckResult(const std::string&)>;

    // Case-insensitive substring match against the configured patterns.
    // Empty patterns never match.
    static bool isCascadeLogin(const std::string& url, const std::vector<std::string>& patterns);

    /**
     * Classify the in-scope links of one page, in order.
     * Non-HTTP(S) links are skipped. A cascade-login match is recorded without
     * invoking checkLink; every other link goes through checkLink and is
     * recorded when its verdict is broken_link.
     */
    static std::vector<ViolationRecord> classifyPageLinks(const std::string& pageUrl,
                                                          const std::vector<std::string>& links,
                                                          const std::vector<std::string>& cascadeLoginPatterns,
                                                          const LinkCheckFn& checkLink);

    // Sorted distinct violation kinds joined by '+', or "none"
    static std::string summarize(const std::vector<ViolationRecord>& violations);
};
