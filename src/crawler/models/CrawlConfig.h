#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <utility>

enum class SchedulerMode {
    FIFO,
    PRIORITY
};

enum class CacheMode {
    NONE,
    LRU
};

struct CheckerConfig {
    // 3xx final responses count as ok instead of broken
    bool treatRedirectAsOk = true;

    // Case-insensitive substrings that flag a link as a cascade login
    std::vector<std::string> cascadeLoginPatterns;

    // Links checked per page; 0 disables the cap
    size_t maxLinksPerPage = 300;
};

struct CacheConfig {
    CacheMode mode = CacheMode::NONE;

    // Capacity of the link-check cache when mode is LRU
    long long maxSize = 10000;
};

struct MockConfig {
    std::string sitemapPath = "data/mock_sitemap.xml";
    std::string samplePagePath = "data/mock_page.html";
    std::string samplePageUrl = "https://www.example.edu/";
};

struct CrawlConfig {
    // Number of worker threads
    size_t threads = 12;

    // Minimum spacing between two requests of the same worker
    std::chrono::milliseconds delay{0};

    // Total timeout of one HTTP request
    std::chrono::milliseconds requestTimeout{10000};

    // Timeout for establishing the TCP/TLS connection
    std::chrono::milliseconds connectTimeout{10000};

    // Maximum number of redirects followed per request
    size_t maxRedirects = 10;

    // User agent string to use in requests
    std::string userAgent = "LinkGuard/0.2";

    // Additional request headers sent with every fetch
    std::vector<std::pair<std::string, std::string>> extraHeaders;

    // Verify TLS certificates and host names
    bool verifySsl = true;

    // Host suffixes that make a link in scope
    std::vector<std::string> domainAllowlist;

    // Whether to parse pages and check their links at all
    bool extractLinks = true;

    // internal_links_found counts every occurrence (true) or distinct targets (false)
    bool countDuplicates = true;

    // Truncate the ordered seed list to this many URLs; 0 means unlimited
    size_t maxUrls = 0;

    SchedulerMode scheduler = SchedulerMode::FIFO;

    CheckerConfig checker;

    CacheConfig cache;

    // === APPLICATION / REPORTING ===

    std::string dataDir = "data";
    std::string outputDir = "output";
    char csvDelimiter = ',';

    // Format run_summary floats with a decimal comma
    bool csvDecimalComma = true;

    std::string sitemapUrl;

    // Mock mode runs the offline demonstration instead of a network crawl
    bool mockMode = false;
    MockConfig mock;

    std::string logLevel = "info";
    std::string logFile;
};

// Upper bounds accepted for the worker pool and for every delay or timeout
constexpr size_t kMaxThreads = 1024;
constexpr std::chrono::seconds kMaxDuration{24 * 60 * 60};

// Invalid or malformed configuration. Fatal, raised before any crawling starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

std::string toString(SchedulerMode mode);
std::string toString(CacheMode mode);

// "fifo" | "priority", case-insensitive; throws ConfigurationError otherwise
SchedulerMode parseSchedulerMode(const std::string& value);

// "none" | "lru", case-insensitive; throws ConfigurationError otherwise
CacheMode parseCacheMode(const std::string& value);

// Range checks shared by the loader and the engine; throws ConfigurationError naming the key
void validateConfig(const CrawlConfig& config);
