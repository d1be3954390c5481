#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include "../../../include/linkguard/crawler/models/ViolationType.h"
#include "../LRUCache.h"

// Outcome of validating one link target. Cached values are immutable copies.
struct LinkCheckResult {
    Verdict verdict = Verdict::OK;

    // HTTP status; empty when no response was received
    std::optional<int> status;

    // Effective URL after redirects; empty on transport failure
    std::string finalUrl;

    // "ok", "status>=400", "redirect ok", "redirect chain len=N", "<ErrorKind>: <message>", ...
    std::string note;

    bool operator==(const LinkCheckResult& other) const = default;
};

// One offending link on a page
struct ViolationRecord {
    std::string pageUrl;
    std::string linkUrl;
    ViolationType type = ViolationType::BROKEN_LINK;
    std::optional<int> status;
    std::string finalUrl;
    std::string note;
};

// One row per crawled page
struct PageResult {
    // The URL as dispatched from the frontier
    std::string url;

    // HTTP status, or 301 when the fetch ended on a different URL; empty on error
    std::optional<int> status;

    // Wall time of the page fetch, in milliseconds
    double timeMs = 0.0;

    // Name of the worker that processed the page
    std::string thread;

    // ISO-8601 UTC, second precision
    std::string startUtc;
    std::string endUtc;

    // Empty on success
    std::string error;

    // Empty when the page was not parsed (error, non-HTML, extraction disabled)
    std::optional<size_t> internalLinksFound;

    std::string finalUrl;
    std::string contentType;

    // "+"-joined sorted distinct violation kinds, or "none"
    std::string violationSummary = "none";

    size_t violationsCount = 0;

    // Monotonic completion time, used to merge worker rows in completion order
    std::chrono::steady_clock::time_point finishedAt;
};

// One row per crawl invocation
struct RunSummary {
    std::string tsUtc;
    std::string scheduler;
    size_t threads = 0;
    double delaySeconds = 0.0;
    size_t urlsTotal = 0;
    double durationSeconds = 0.0;
    double urlsPerSecond = 0.0;
    size_t brokenLinksTotal = 0;
    size_t cascadeLoginsTotal = 0;
    size_t pagesWithViolations = 0;
    size_t totalLinksFound = 0;
    std::string cacheMode;
    long long cacheMaxSize = 0;
    CacheStats cache;
    std::optional<double> cpuPercentAvg;
    std::optional<double> memoryRssMb;
};

struct CrawlReport {
    std::vector<PageResult> pages;
    std::vector<ViolationRecord> violations;
    RunSummary summary;
};
