#pragma once

#include <string>
#include <vector>
#include <memory>
#include <thread>
#include "models/CrawlConfig.h"
#include "models/CrawlResult.h"
#include "../../include/linkguard/crawler/HttpFetcher.h"

/**
 * Runs one crawl over a fixed seed list with a pool of PageWorkers.
 *
 * The seed list is ordered by the Scheduler, truncated to max_urls and loaded
 * into a URLFrontier. Each worker owns a fetcher produced by the factory;
 * the visited set and the optional link-check cache are shared. Rows are
 * merged in completion order once all workers have drained the frontier.
 */
class CrawlEngine {
public:
    // Throws ConfigurationError for an invalid configuration
    CrawlEngine(const CrawlConfig& config, linkguard::crawler::FetcherFactory fetcherFactory);
    ~CrawlEngine();

    // Crawl every URL once. summary.urlsPerSecond is the run's throughput.
    CrawlReport crawlAll(const std::vector<std::string>& urls);

private:
    // Join every started worker thread
    static void joinAll(std::vector<std::thread>& threads);

    // Aggregate counters over the merged rows
    static void aggregate(CrawlReport& report);

    CrawlConfig config;
    linkguard::crawler::FetcherFactory fetcherFactory;
};
