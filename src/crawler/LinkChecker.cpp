#include "LinkChecker.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/linkguard/common/UrlNormalizer.h"

using linkguard::crawler::PageFetchResult;

LinkCheckResult LinkChecker::classifyResponse(const PageFetchResult& response, const CheckerConfig& config) {
    LinkCheckResult result;
    result.status = response.statusCode;
    result.finalUrl = response.finalUrl;

    if (response.statusCode >= 400) {
        result.verdict = Verdict::BROKEN_LINK;
        result.note = "status>=400";
    } else if (response.statusCode >= 300) {
        if (config.treatRedirectAsOk) {
            result.verdict = Verdict::OK;
            result.note = "redirect ok";
        } else {
            result.verdict = Verdict::BROKEN_LINK;
            result.note = "redirect treated as broken";
        }
    } else {
        result.verdict = Verdict::OK;
        result.note = response.redirectCount > 0
            ? "redirect chain len=" + std::to_string(response.redirectCount)
            : "ok";
    }
    return result;
}

LinkCheckResult LinkChecker::checkLink(const std::string& url,
                                       linkguard::crawler::HttpFetcher& fetcher,
                                       const CheckerConfig& config,
                                       LinkCheckCache* cache) {
    const std::string key = linkguard::common::cacheKeyForm(url);

    if (cache) {
        if (auto cached = cache->get(key)) {
            LOG_TRACE("Link check cache hit: " + key);
            return *cached;
        }
    }

    PageFetchResult response = fetcher.fetch(url);

    LinkCheckResult result;
    if (!response.responseReceived) {
        result.verdict = Verdict::BROKEN_LINK;
        result.note = FailureClassifier::describeTransportFailure(response);
    } else {
        result = classifyResponse(response, config);
    }

    if (result.verdict == Verdict::BROKEN_LINK) {
        LOG_DEBUG("Broken link " + url + " (" + result.note + ")");
    }

    if (cache) {
        cache->set(key, result);
    }

    return result;
}
