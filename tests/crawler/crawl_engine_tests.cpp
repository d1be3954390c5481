#include <catch2/catch_test_macros.hpp>
#include "CrawlEngine.h"
#include "../../include/crawler/CrawlLogger.h"
#include "support/MockFetcher.h"
#include <algorithm>
#include <mutex>
#include <set>

namespace {

CrawlConfig engineConfig(size_t threads = 4) {
    CrawlConfig config;
    config.threads = threads;
    config.domainAllowlist = {"example.edu"};
    return config;
}

const PageResult* findPage(const CrawlReport& report, const std::string& url) {
    auto it = std::find_if(report.pages.begin(), report.pages.end(),
                           [&url](const PageResult& page) { return page.url == url; });
    return it == report.pages.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("CrawlEngine validates its configuration", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();

    SECTION("Zero threads") {
        CrawlConfig config = engineConfig(0);
        REQUIRE_THROWS_AS(CrawlEngine(config, MockFetcher::factory(site)), ConfigurationError);
    }

    SECTION("Non-positive cache capacity") {
        CrawlConfig config = engineConfig();
        config.cache.mode = CacheMode::LRU;
        config.cache.maxSize = 0;
        REQUIRE_THROWS_AS(CrawlEngine(config, MockFetcher::factory(site)), ConfigurationError);
    }

    SECTION("Thread counts beyond the pool limit") {
        CrawlConfig config = engineConfig(kMaxThreads + 1);
        REQUIRE_THROWS_AS(CrawlEngine(config, MockFetcher::factory(site)), ConfigurationError);

        config.threads = 100000;
        REQUIRE_THROWS_AS(CrawlEngine(config, MockFetcher::factory(site)), ConfigurationError);

        config.threads = kMaxThreads;
        REQUIRE_NOTHROW(CrawlEngine(config, MockFetcher::factory(site)));
    }

    SECTION("Timeouts beyond a day") {
        CrawlConfig config = engineConfig();
        config.requestTimeout = std::chrono::hours(25);
        REQUIRE_THROWS_AS(CrawlEngine(config, MockFetcher::factory(site)), ConfigurationError);
    }

    SECTION("Missing fetcher factory") {
        REQUIRE_THROWS_AS(CrawlEngine(engineConfig(), nullptr), ConfigurationError);
    }

    SECTION("Capacity is ignored without an LRU cache") {
        CrawlConfig config = engineConfig();
        config.cache.maxSize = 0;
        REQUIRE_NOTHROW(CrawlEngine(config, MockFetcher::factory(site)));
    }
}

TEST_CASE("CrawlEngine processes each distinct URL once", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    std::vector<std::string> seeds;
    for (int i = 0; i < 20; ++i) {
        std::string url = "https://example.edu/p" + std::to_string(i);
        site->status(url, 200);
        seeds.push_back(url);
        seeds.push_back(url);
        if (i % 3 == 0) {
            seeds.push_back(url);
        }
    }

    CrawlEngine engine(engineConfig(8), MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll(seeds);

    REQUIRE(report.pages.size() == 20);
    REQUIRE(site->totalCalls() == 20);
    REQUIRE(site->maxCallsPerUrl() == 1);

    std::set<std::string> urls;
    for (const auto& page : report.pages) {
        urls.insert(page.url);
    }
    REQUIRE(urls.size() == 20);
    REQUIRE(report.summary.urlsTotal == seeds.size());
}

TEST_CASE("CrawlEngine end-to-end scenario", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    site->page("https://example.edu/a",
               "<html><body><nav><a href=\"/nav\">n</a></nav><main>"
               "<a href=\"/b\">b</a>"
               "<a href=\"/missing\">missing</a>"
               "<a href=\"mailto:x@example.edu\">mail</a>"
               "</main></body></html>");
    site->status("https://example.edu/b", 200);
    site->status("https://example.edu/missing", 404);

    CrawlEngine engine(engineConfig(2), MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll({"https://example.edu/a"});

    REQUIRE(report.pages.size() == 1);
    const PageResult& page = report.pages[0];
    REQUIRE(page.status == 200);
    REQUIRE(page.internalLinksFound == 3u);
    REQUIRE(page.violationsCount == 1);
    REQUIRE(page.violationSummary == "broken_link");

    REQUIRE(report.violations.size() == 1);
    const ViolationRecord& violation = report.violations[0];
    REQUIRE(violation.pageUrl == "https://example.edu/a");
    REQUIRE(violation.linkUrl == "https://example.edu/missing");
    REQUIRE(violation.type == ViolationType::BROKEN_LINK);
    REQUIRE(violation.status == 404);
    REQUIRE(violation.note == "status>=400");

    REQUIRE(site->calls("https://example.edu/nav") == 0);

    const RunSummary& summary = report.summary;
    REQUIRE(summary.urlsTotal == 1);
    REQUIRE(summary.brokenLinksTotal == 1);
    REQUIRE(summary.cascadeLoginsTotal == 0);
    REQUIRE(summary.pagesWithViolations == 1);
    REQUIRE(summary.totalLinksFound == 3);
    REQUIRE(summary.scheduler == "fifo");
    REQUIRE(summary.cacheMode == "none");
    REQUIRE(summary.cache.accesses == 0);
    REQUIRE(summary.urlsPerSecond > 0.0);
}

TEST_CASE("CrawlEngine reports cascade logins next to broken links", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    site->page("https://example.edu/portal",
               "<main>"
               "<a href=\"https://example.edu/cas/login?service=portal\">sign in</a>"
               "<a href=\"/gone\">gone</a>"
               "<a href=\"/fine\">fine</a>"
               "</main>");
    site->status("https://example.edu/gone", 404);
    site->status("https://example.edu/fine", 200);

    CrawlConfig config = engineConfig(2);
    config.checker.cascadeLoginPatterns = {"/CAS/LOGIN"};

    CrawlEngine engine(config, MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll({"https://example.edu/portal"});

    REQUIRE(report.pages.size() == 1);
    const PageResult& page = report.pages[0];
    REQUIRE(page.violationSummary == "broken_link+cascade_login");
    REQUIRE(page.violationsCount == 2);
    REQUIRE(page.internalLinksFound == 3u);

    REQUIRE(report.violations.size() == 2);
    auto cascade = std::find_if(report.violations.begin(), report.violations.end(),
                                [](const ViolationRecord& v) { return v.type == ViolationType::CASCADE_LOGIN; });
    REQUIRE(cascade != report.violations.end());
    REQUIRE(cascade->linkUrl == "https://example.edu/cas/login");
    REQUIRE(cascade->note == "cascade login link");
    REQUIRE_FALSE(cascade->status.has_value());

    REQUIRE(report.summary.cascadeLoginsTotal == 1);
    REQUIRE(report.summary.brokenLinksTotal == 1);
    REQUIRE(report.summary.pagesWithViolations == 1);

    REQUIRE(site->calls("https://example.edu/cas/login") == 0);
    REQUIRE(site->calls("https://example.edu/cas/login?service=portal") == 0);
    REQUIRE(site->calls("https://example.edu/gone") == 1);
}

TEST_CASE("CrawlEngine collapses redirects to 301", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    site->redirect("https://example.edu/old", "https://example.edu/new", 200, 1, "<main></main>");
    site->redirect("https://example.edu/slash", "https://example.edu/slash/", 200, 1, "<main></main>");

    CrawlEngine engine(engineConfig(2), MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll({"https://example.edu/old", "https://example.edu/slash"});

    const PageResult* redirected = findPage(report, "https://example.edu/old");
    const PageResult* sameResource = findPage(report, "https://example.edu/slash");
    REQUIRE(redirected != nullptr);
    REQUIRE(sameResource != nullptr);
    REQUIRE(redirected->status == 301);
    REQUIRE(sameResource->status == 200);
}

TEST_CASE("CrawlEngine reuses link checks through the LRU cache", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    const std::string links =
        "<main><a href=\"https://example.edu/shared?x=1\">1</a>"
        "<a href=\"https://example.edu/shared?x=2\">2</a></main>";
    site->page("https://example.edu/p1", links);
    site->page("https://example.edu/p2", links);
    site->status("https://example.edu/shared", 200);

    CrawlConfig config = engineConfig(1);
    config.cache.mode = CacheMode::LRU;
    config.cache.maxSize = 100;

    CrawlEngine engine(config, MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll({"https://example.edu/p1", "https://example.edu/p2"});

    REQUIRE(report.pages.size() == 2);
    REQUIRE(report.summary.cacheMode == "lru");
    REQUIRE(report.summary.cacheMaxSize == 100);
    REQUIRE(report.summary.cache.hits >= 1);
    REQUIRE(report.summary.cache.accesses == report.summary.cache.hits + report.summary.cache.misses);
    REQUIRE(site->calls("https://example.edu/shared") == 1);
    REQUIRE(report.violations.empty());
}

TEST_CASE("CrawlEngine honours max_urls and the scheduler", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    site->status("https://example.edu/deep/er/page", 200);
    site->status("https://example.edu/top", 200);
    site->status("https://example.edu/mid/page", 200);

    CrawlConfig config = engineConfig(1);
    config.scheduler = SchedulerMode::PRIORITY;
    config.maxUrls = 2;

    CrawlEngine engine(config, MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll({
        "https://example.edu/deep/er/page",
        "https://example.edu/top",
        "https://example.edu/mid/page",
    });

    REQUIRE(report.summary.urlsTotal == 2);
    REQUIRE(report.summary.scheduler == "priority");
    REQUIRE(report.pages.size() == 2);
    REQUIRE(report.pages[0].url == "https://example.edu/top");
    REQUIRE(report.pages[1].url == "https://example.edu/mid/page");
    REQUIRE(site->calls("https://example.edu/deep/er/page") == 0);
}

TEST_CASE("CrawlEngine isolates per-page failures", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    site->page("https://example.edu/ok", "<main></main>");
    site->fail("https://example.edu/down", CURLE_COULDNT_CONNECT, "Connection refused");

    CrawlEngine engine(engineConfig(2), MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll({"https://example.edu/down", "https://example.edu/ok"});

    REQUIRE(report.pages.size() == 2);
    const PageResult* down = findPage(report, "https://example.edu/down");
    REQUIRE(down != nullptr);
    REQUIRE_FALSE(down->status.has_value());
    REQUIRE(down->error == "ConnectionError: Connection refused");
    REQUIRE(findPage(report, "https://example.edu/ok")->status == 200);
}

TEST_CASE("CrawlEngine reports progress", "[CrawlEngine]") {
    auto site = std::make_shared<MockSite>();
    std::vector<std::string> seeds;
    for (int i = 0; i < 150; ++i) {
        std::string url = "https://example.edu/n" + std::to_string(i);
        site->status(url, 200);
        seeds.push_back(url);
    }

    std::mutex progressMutex;
    std::vector<std::pair<size_t, size_t>> notices;
    CrawlLogger::setProgressFunction([&](size_t processed, size_t total) {
        std::lock_guard<std::mutex> lock(progressMutex);
        notices.emplace_back(processed, total);
    });

    CrawlEngine engine(engineConfig(4), MockFetcher::factory(site));
    CrawlReport report = engine.crawlAll(seeds);
    CrawlLogger::setProgressFunction(nullptr);

    REQUIRE(report.pages.size() == 150);
    std::sort(notices.begin(), notices.end());
    REQUIRE(notices == std::vector<std::pair<size_t, size_t>>{{100, 150}, {150, 150}});

    for (size_t i = 1; i < report.pages.size(); ++i) {
        REQUIRE(report.pages[i - 1].finishedAt <= report.pages[i].finishedAt);
    }
}
