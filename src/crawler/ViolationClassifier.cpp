#include "ViolationClassifier.h"
#include "../../include/Logger.h"
#include "../../include/linkguard/common/UrlNormalizer.h"
#include <set>

bool ViolationClassifier::isCascadeLogin(const std::string& url, const std::vector<std::string>& patterns) {
    if (patterns.empty()) {
        return false;
    }
    const std::string lowered = linkguard::common::toLower(url);
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        if (lowered.find(linkguard::common::toLower(pattern)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<ViolationRecord> ViolationClassifier::classifyPageLinks(const std::string& pageUrl,
                                                                    const std::vector<std::string>& links,
                                                                    const std::vector<std::string>& cascadeLoginPatterns,
                                                                    const LinkCheckFn& checkLink) {
    std::vector<ViolationRecord> violations;

    for (const auto& link : links) {
        const std::string scheme = linkguard::common::parseUrl(link).scheme;
        if (scheme != "http" && scheme != "https") {
            continue;
        }

        if (isCascadeLogin(link, cascadeLoginPatterns)) {
            ViolationRecord record;
            record.pageUrl = pageUrl;
            record.linkUrl = link;
            record.type = ViolationType::CASCADE_LOGIN;
            record.note = "cascade login link";
            violations.push_back(std::move(record));
            continue;
        }

        LinkCheckResult checked = checkLink(link);
        if (checked.verdict == Verdict::BROKEN_LINK) {
            ViolationRecord record;
            record.pageUrl = pageUrl;
            record.linkUrl = link;
            record.type = ViolationType::BROKEN_LINK;
            record.status = checked.status;
            record.finalUrl = checked.finalUrl;
            record.note = checked.note;
            violations.push_back(std::move(record));
        }
    }

    if (!violations.empty()) {
        LOG_DEBUG(std::to_string(violations.size()) + " violations on " + pageUrl);
    }
    return violations;
}

std::string ViolationClassifier::summarize(const std::vector<ViolationRecord>& violations) {
    std::set<std::string> kinds;
    for (const auto& violation : violations) {
        kinds.insert(toString(violation.type));
    }
    if (kinds.empty()) {
        return "none";
    }

    std::string summary;
    for (const auto& kind : kinds) {
        if (!summary.empty()) {
            summary += "+";
        }
        summary += kind;
    }
    return summary;
}
