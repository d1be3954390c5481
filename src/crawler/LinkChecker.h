#pragma once

#include <string>
#include "LRUCache.h"
#include "models/CrawlConfig.h"
#include "models/CrawlResult.h"
#include "../../include/linkguard/crawler/HttpFetcher.h"

// Link-check memo keyed by cacheKeyForm(url)
using LinkCheckCache = LRUCache<std::string, LinkCheckResult>;

class LinkChecker {
public:
    /**
     * Validate one link target.
     *
     * Served verbatim from the cache when it holds cacheKeyForm(url); otherwise
     * GETs the URL through the caller's fetcher and stores the outcome under the
     * cache key before returning. Transport failures are a terminal broken_link
     * verdict, never retried and never thrown.
     */
    static LinkCheckResult checkLink(const std::string& url,
                                     linkguard::crawler::HttpFetcher& fetcher,
                                     const CheckerConfig& config,
                                     LinkCheckCache* cache = nullptr);

    // Verdict for a response that arrived
    static LinkCheckResult classifyResponse(const linkguard::crawler::PageFetchResult& response,
                                            const CheckerConfig& config);
};
