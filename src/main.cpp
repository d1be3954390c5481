#include <chrono>
#include <csignal>
#include <execinfo.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <unistd.h>

#include "../include/Logger.h"
#include "config/ConfigLoader.h"
#include "crawler/ContentParser.h"
#include "crawler/CrawlEngine.h"
#include "crawler/PageFetcher.h"
#include "report/CsvReportWriter.h"
#include "sitemap/SitemapParser.h"

namespace {

// Log a backtrace on fatal signals
void installCrashHandler() {
    auto handler = [](int sig) {
        void* array[64];
        int size = backtrace(array, 64);
        std::cerr << "[FATAL] Signal " << sig << " received. Backtrace (" << size << "):\n";
        backtrace_symbols_fd(array, size, STDERR_FILENO);
        _exit(128 + sig);
    };
    std::signal(SIGSEGV, handler);
    std::signal(SIGABRT, handler);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [config.json]\n"
              << "  Without an argument the configuration is read from $LINKGUARD_CONFIG or ./config.json\n";
}

std::unique_ptr<linkguard::crawler::HttpFetcher> makeFetcher(const CrawlConfig& config) {
    auto fetcher = std::make_unique<PageFetcher>(config.userAgent, config.requestTimeout,
                                                 config.connectTimeout, config.maxRedirects);
    fetcher->setVerifySSL(config.verifySsl);
    if (!config.extraHeaders.empty()) {
        fetcher->setCustomHeaders(config.extraHeaders);
    }
    return fetcher;
}

std::string urlListPath(const CrawlConfig& config) {
    return (std::filesystem::path(config.dataDir) / "urls_initial.csv").string();
}

// Offline walkthrough: local sitemap to seed list, local sample page to link list
int runMockDemo(const CrawlConfig& config) {
    auto urls = SitemapParser::normalizeAll(
        SitemapParser::extractLocations(SitemapParser::loadFile(config.mock.sitemapPath)));
    SitemapParser::writeUrlList(urlListPath(config), urls);
    LOG_INFO("[sitemap] wrote " + std::to_string(urls.size()) + " URLs -> " + urlListPath(config));

    auto start = std::chrono::steady_clock::now();
    std::string html = SitemapParser::loadFile(config.mock.samplePagePath);
    std::chrono::duration<double, std::milli> readTime = std::chrono::steady_clock::now() - start;
    LOG_INFO_STREAM("[fetch] sanity metric: " << std::fixed << std::setprecision(2)
                    << readTime.count() << " ms / request");

    ContentParser parser;
    LinkPartition partition = parser.partitionLinks(config.mock.samplePageUrl, html, config.domainAllowlist);
    LOG_INFO("[parse] internal=" + std::to_string(partition.internal.size()) +
             " external=" + std::to_string(partition.external.size()));

    CsvReportWriter writer(config.outputDir, config.csvDelimiter, config.csvDecimalComma);
    writer.writeLinkSample(config.mock.samplePageUrl, partition.internal);
    return 0;
}

int runCrawl(const CrawlConfig& config) {
    if (config.sitemapUrl.empty()) {
        throw ConfigurationError("sitemap_url: required when mock_mode is false");
    }

    {
        auto fetcher = makeFetcher(config);
        auto urls = SitemapParser::normalizeAll(
            SitemapParser::extractLocations(SitemapParser::download(config.sitemapUrl, *fetcher)));
        SitemapParser::writeUrlList(urlListPath(config), urls);
        LOG_INFO("[sitemap] wrote " + std::to_string(urls.size()) + " URLs -> " + urlListPath(config));
    }

    std::vector<std::string> seeds = SitemapParser::readUrlList(urlListPath(config));

    CrawlEngine engine(config, [&config]() { return makeFetcher(config); });
    CrawlReport report = engine.crawlAll(seeds);

    CsvReportWriter writer(config.outputDir, config.csvDelimiter, config.csvDecimalComma);
    writer.writePageResults(report.pages);
    writer.writeViolations(report.violations);
    writer.appendRunSummary(report.summary);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    installCrashHandler();
    Logger::getInstance().init(LogLevel::INFO, true);

    std::string configArg;
    if (argc > 1) {
        configArg = argv[1];
        if (configArg == "-h" || configArg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }
    if (argc > 2) {
        printUsage(argv[0]);
        return 2;
    }

    CrawlConfig config;
    try {
        config = ConfigLoader::loadFromFile(ConfigLoader::resolvePath(configArg));
    } catch (const ConfigurationError& e) {
        LOG_ERROR(std::string("Configuration error: ") + e.what());
        return 1;
    }

    Logger::getInstance().init(parseLogLevel(config.logLevel), true, config.logFile);
    LOG_INFO("linkguard starting (" + std::string(config.mockMode ? "mock" : "crawl") + " mode)");

    try {
        return config.mockMode ? runMockDemo(config) : runCrawl(config);
    } catch (const ConfigurationError& e) {
        LOG_ERROR(std::string("Configuration error: ") + e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
    }
    return 1;
}
