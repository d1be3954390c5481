#include "CrawlEngine.h"
#include "PageWorker.h"
#include "Scheduler.h"
#include "URLFrontier.h"
#include "../common/ProcessStats.h"
#include "../../include/Logger.h"
#include "../../include/crawler/CrawlLogger.h"
#include "../../include/linkguard/common/Clock.h"
#include <algorithm>
#include <atomic>
#include <iomanip>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>

CrawlEngine::CrawlEngine(const CrawlConfig& config, linkguard::crawler::FetcherFactory fetcherFactory)
    : config(config)
    , fetcherFactory(std::move(fetcherFactory)) {
    validateConfig(this->config);
    if (!this->fetcherFactory) {
        throw ConfigurationError("CrawlEngine requires a fetcher factory");
    }
}

CrawlEngine::~CrawlEngine() = default;

CrawlReport CrawlEngine::crawlAll(const std::vector<std::string>& urls) {
    CrawlReport report;
    RunSummary& summary = report.summary;
    summary.tsUtc = linkguard::common::isoUtcNow();
    summary.scheduler = toString(config.scheduler);
    summary.threads = config.threads;
    summary.delaySeconds = static_cast<double>(config.delay.count()) / 1000.0;
    summary.cacheMode = toString(config.cache.mode);
    summary.cacheMaxSize = config.cache.maxSize;

    std::vector<std::string> ordered = Scheduler::orderURLs(urls, config.scheduler);
    if (config.maxUrls > 0 && ordered.size() > config.maxUrls) {
        ordered.resize(config.maxUrls);
    }
    summary.urlsTotal = ordered.size();

    URLFrontier frontier;
    for (const auto& url : ordered) {
        frontier.addURL(url);
    }
    std::unordered_set<std::string> distinct(ordered.begin(), ordered.end());
    distinct.erase("");
    const size_t total = distinct.size();

    std::unique_ptr<LinkCheckCache> cache;
    if (config.cache.mode == CacheMode::LRU) {
        try {
            cache = std::make_unique<LinkCheckCache>(config.cache.maxSize);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(std::string("cache.max_size: ") + e.what());
        }
    }

    LOG_INFO("Starting crawl of " + std::to_string(total) + " pages with " +
             std::to_string(config.threads) + " threads (scheduler=" + summary.scheduler +
             ", cache=" + summary.cacheMode + ")");
    CrawlLogger::broadcastLog("Crawl started: " + std::to_string(total) + " pages", "info");

    ProcessStats processStats;
    auto startTime = std::chrono::steady_clock::now();

    std::atomic<size_t> processed{0};
    std::vector<std::unique_ptr<PageWorker>> workers;
    workers.reserve(config.threads);
    for (size_t i = 0; i < config.threads; ++i) {
        workers.push_back(std::make_unique<PageWorker>(
            "worker-" + std::to_string(i + 1), config, fetcherFactory(),
            frontier, cache.get(), processed, total));
    }

    std::vector<std::thread> threads;
    threads.reserve(workers.size());
    try {
        for (auto& worker : workers) {
            threads.emplace_back(&PageWorker::run, worker.get());
        }
    } catch (const std::system_error& e) {
        size_t dropped = frontier.clearQueue();
        LOG_ERROR("Started only " + std::to_string(threads.size()) + " of " + std::to_string(workers.size()) +
                  " worker threads (" + e.what() + "), abandoning " + std::to_string(dropped) + " queued URLs");
        joinAll(threads);
        throw std::runtime_error(std::string("Could not start worker threads: ") + e.what());
    }
    joinAll(threads);

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
    summary.durationSeconds = elapsed.count();

    for (auto& worker : workers) {
        auto pages = worker->takeResults();
        auto violations = worker->takeViolations();
        report.pages.insert(report.pages.end(),
                            std::make_move_iterator(pages.begin()), std::make_move_iterator(pages.end()));
        report.violations.insert(report.violations.end(),
                                 std::make_move_iterator(violations.begin()), std::make_move_iterator(violations.end()));
    }

    // Completion order across workers; each worker's own rows are already ordered
    std::stable_sort(report.pages.begin(), report.pages.end(),
                     [](const PageResult& a, const PageResult& b) { return a.finishedAt < b.finishedAt; });

    std::unordered_map<std::string, std::chrono::steady_clock::time_point> pageFinished;
    for (const auto& page : report.pages) {
        pageFinished[page.url] = page.finishedAt;
    }
    std::stable_sort(report.violations.begin(), report.violations.end(),
                     [&pageFinished](const ViolationRecord& a, const ViolationRecord& b) {
                         return pageFinished[a.pageUrl] < pageFinished[b.pageUrl];
                     });

    summary.urlsPerSecond = summary.durationSeconds > 0.0
        ? static_cast<double>(report.pages.size()) / summary.durationSeconds
        : 0.0;
    aggregate(report);

    if (cache) {
        summary.cache = cache->stats();
    }
    summary.cpuPercentAvg = processStats.cpuPercent();
    summary.memoryRssMb = ProcessStats::residentMemoryMb();

    LOG_INFO_STREAM(std::fixed << std::setprecision(2)
                    << "Crawl finished: " << report.pages.size() << " pages in "
                    << summary.durationSeconds << " s (" << summary.urlsPerSecond << " URLs/s)");
    LOG_INFO("Broken links: " + std::to_string(summary.brokenLinksTotal) +
             ", cascade logins: " + std::to_string(summary.cascadeLoginsTotal) +
             ", pages with violations: " + std::to_string(summary.pagesWithViolations));
    if (cache) {
        LOG_INFO_STREAM(std::fixed << std::setprecision(3)
                        << "Link cache: " << summary.cache.accesses << " accesses, "
                        << summary.cache.hits << " hits, hit ratio " << summary.cache.hitRatio);
    }
    CrawlLogger::broadcastLog("Crawl finished: " + std::to_string(report.pages.size()) + " pages", "info");

    return report;
}

void CrawlEngine::joinAll(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void CrawlEngine::aggregate(CrawlReport& report) {
    RunSummary& summary = report.summary;

    std::unordered_set<std::string> pagesWithViolations;
    for (const auto& violation : report.violations) {
        if (violation.type == ViolationType::BROKEN_LINK) {
            ++summary.brokenLinksTotal;
        } else if (violation.type == ViolationType::CASCADE_LOGIN) {
            ++summary.cascadeLoginsTotal;
        }
        pagesWithViolations.insert(violation.pageUrl);
    }
    summary.pagesWithViolations = pagesWithViolations.size();

    for (const auto& page : report.pages) {
        if (page.internalLinksFound) {
            summary.totalLinksFound += *page.internalLinksFound;
        }
    }
}
