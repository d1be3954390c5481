#include "PageWorker.h"
#include "FailureClassifier.h"
#include "ViolationClassifier.h"
#include "../../include/Logger.h"
#include "../../include/crawler/CrawlLogger.h"
#include "../../include/linkguard/common/Clock.h"
#include "../../include/linkguard/common/UrlNormalizer.h"
#include <thread>

using linkguard::crawler::HttpFetcher;
using linkguard::crawler::PageFetchResult;

RateLimiter::RateLimiter(std::chrono::milliseconds delay)
    : delay(delay) {}

void RateLimiter::wait() {
    if (delay.count() <= 0) {
        return;
    }

    if (!lastRequest) {
        std::this_thread::sleep_for(delay);
    } else {
        auto elapsed = std::chrono::steady_clock::now() - *lastRequest;
        if (elapsed < delay) {
            std::this_thread::sleep_for(delay - elapsed);
        }
    }
    lastRequest = std::chrono::steady_clock::now();
}

PageWorker::PageWorker(std::string name,
                       const CrawlConfig& config,
                       std::unique_ptr<HttpFetcher> fetcher,
                       URLFrontier& frontier,
                       LinkCheckCache* cache,
                       std::atomic<size_t>& processed,
                       size_t total)
    : name(std::move(name))
    , config(config)
    , fetcher(std::move(fetcher))
    , frontier(frontier)
    , cache(cache)
    , processed(processed)
    , total(total)
    , rateLimiter(config.delay) {}

void PageWorker::run() {
    LOG_DEBUG(name + " started");

    while (true) {
        std::string url = frontier.getNextURL();
        if (url.empty()) {
            break;
        }

        if (!frontier.tryMarkVisited(url)) {
            LOG_TRACE(name + " skipping already visited " + url);
            continue;
        }

        rateLimiter.wait();
        record(processPage(url));
    }

    LOG_DEBUG(name + " drained after " + std::to_string(results.size()) + " pages");
}

PageOutcome PageWorker::processPage(const std::string& url) {
    using namespace linkguard::common;

    PageOutcome outcome;
    PageResult& page = outcome.page;
    page.url = url;
    page.thread = name;
    page.startUtc = isoUtcNow();

    auto startTime = std::chrono::steady_clock::now();
    bool timed = false;
    auto stopTimer = [&]() {
        if (!timed) {
            std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - startTime;
            page.timeMs = elapsed.count();
            timed = true;
        }
    };

    try {
        PageFetchResult response = fetcher->fetch(url);
        stopTimer();

        if (!response.responseReceived) {
            page.error = FailureClassifier::describeTransportFailure(response);
            LOG_WARNING("Fetch failed for " + url + ": " + page.error);
        } else {
            page.finalUrl = response.finalUrl;
            page.contentType = response.contentType;

            // A redirect to a different resource is reported as 301 whatever the final code
            if (comparisonForm(url) != comparisonForm(response.finalUrl)) {
                page.status = 301;
            } else {
                page.status = static_cast<int>(response.statusCode);
            }

            bool isHtml = toLower(response.contentType).find("text/html") != std::string::npos;
            if (config.extractLinks && response.statusCode < 400 && isHtml) {
                ExtractedLinks extracted = contentParser.extractInternalLinks(
                    url, response.content, config.domainAllowlist, config.countDuplicates);
                page.internalLinksFound = extracted.count;

                std::vector<std::string>& links = extracted.links;
                if (config.checker.maxLinksPerPage > 0 && links.size() > config.checker.maxLinksPerPage) {
                    links.resize(config.checker.maxLinksPerPage);
                }

                outcome.violations = ViolationClassifier::classifyPageLinks(
                    url, links, config.checker.cascadeLoginPatterns,
                    [this](const std::string& link) {
                        return LinkChecker::checkLink(link, *fetcher, config.checker, cache);
                    });

                page.violationSummary = ViolationClassifier::summarize(outcome.violations);
                page.violationsCount = outcome.violations.size();
            }
        }
    } catch (const std::exception& e) {
        stopTimer();
        page.status.reset();
        page.internalLinksFound.reset();
        page.error = FailureClassifier::describeException(e);
        page.violationSummary = "none";
        page.violationsCount = 0;
        outcome.violations.clear();
        LOG_ERROR("Error processing " + url + ": " + page.error);
    }

    page.endUtc = isoUtcNow();
    page.finishedAt = std::chrono::steady_clock::now();
    return outcome;
}

void PageWorker::record(PageOutcome&& outcome) {
    for (auto& violation : outcome.violations) {
        violations.push_back(std::move(violation));
    }
    results.push_back(std::move(outcome.page));

    size_t done = processed.fetch_add(1) + 1;
    CrawlLogger::reportProgress(done, total);
}
