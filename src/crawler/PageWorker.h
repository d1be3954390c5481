#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <optional>
#include "ContentParser.h"
#include "LinkChecker.h"
#include "URLFrontier.h"
#include "models/CrawlConfig.h"
#include "models/CrawlResult.h"
#include "../../include/linkguard/crawler/HttpFetcher.h"

// Spaces out the requests of one worker. Owned by the worker, never shared.
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds delay);

    // Sleep until at least `delay` has passed since the previous call returned.
    // The first call waits the full delay as well.
    void wait();

private:
    std::chrono::milliseconds delay;
    std::optional<std::chrono::steady_clock::time_point> lastRequest;
};

struct PageOutcome {
    PageResult page;
    std::vector<ViolationRecord> violations;
};

// One crawl thread: pulls page URLs from the shared frontier until it is
// drained, fetches each page with its own HTTP client, extracts and checks the
// page's links and keeps the resulting rows locally until the engine collects
// them after the join.
class PageWorker {
public:
    PageWorker(std::string name,
               const CrawlConfig& config,
               std::unique_ptr<linkguard::crawler::HttpFetcher> fetcher,
               URLFrontier& frontier,
               LinkCheckCache* cache,
               std::atomic<size_t>& processed,
               size_t total);

    // Dequeue/dedupe/rate-limit/process loop; returns once the frontier is empty
    void run();

    // Fetch, extract, check and build the rows for one page. Never throws:
    // unexpected exceptions become an error row.
    PageOutcome processPage(const std::string& url);

    const std::string& getName() const { return name; }

    std::vector<PageResult> takeResults() { return std::move(results); }
    std::vector<ViolationRecord> takeViolations() { return std::move(violations); }

private:
    void record(PageOutcome&& outcome);

    std::string name;
    const CrawlConfig& config;
    std::unique_ptr<linkguard::crawler::HttpFetcher> fetcher;
    URLFrontier& frontier;
    LinkCheckCache* cache;
    std::atomic<size_t>& processed;
    size_t total;

    RateLimiter rateLimiter;
    ContentParser contentParser;

    std::vector<PageResult> results;
    std::vector<ViolationRecord> violations;
};
