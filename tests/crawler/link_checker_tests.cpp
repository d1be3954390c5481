#include <catch2/catch_test_macros.hpp>
#include "LinkChecker.h"
#include "support/MockFetcher.h"

TEST_CASE("LinkChecker classifies responses", "[LinkChecker]") {
    auto site = std::make_shared<MockSite>();
    MockFetcher fetcher(site);
    CheckerConfig config;

    SECTION("2xx is ok") {
        site->status("https://example.edu/b", 200);
        auto result = LinkChecker::checkLink("https://example.edu/b", fetcher, config);
        REQUIRE(result.verdict == Verdict::OK);
        REQUIRE(result.status == 200);
        REQUIRE(result.note == "ok");
    }

    SECTION("4xx and 5xx are broken") {
        site->status("https://example.edu/missing", 404);
        site->status("https://example.edu/error", 503);

        auto missing = LinkChecker::checkLink("https://example.edu/missing", fetcher, config);
        REQUIRE(missing.verdict == Verdict::BROKEN_LINK);
        REQUIRE(missing.status == 404);
        REQUIRE(missing.note == "status>=400");

        auto error = LinkChecker::checkLink("https://example.edu/error", fetcher, config);
        REQUIRE(error.verdict == Verdict::BROKEN_LINK);
        REQUIRE(error.note == "status>=400");
    }

    SECTION("A final 3xx depends on treat_redirect_as_ok") {
        site->status("https://example.edu/moved", 302);

        auto accepted = LinkChecker::checkLink("https://example.edu/moved", fetcher, config);
        REQUIRE(accepted.verdict == Verdict::OK);
        REQUIRE(accepted.note == "redirect ok");

        config.treatRedirectAsOk = false;
        auto rejected = LinkChecker::checkLink("https://example.edu/moved", fetcher, config);
        REQUIRE(rejected.verdict == Verdict::BROKEN_LINK);
        REQUIRE(rejected.status == 302);
    }

    SECTION("A followed redirect chain is reported in the note") {
        site->redirect("https://example.edu/old", "https://example.edu/new", 200, 2);
        auto result = LinkChecker::checkLink("https://example.edu/old", fetcher, config);
        REQUIRE(result.verdict == Verdict::OK);
        REQUIRE(result.finalUrl == "https://example.edu/new");
        REQUIRE(result.note == "redirect chain len=2");
    }

    SECTION("Transport failures are broken links, never exceptions") {
        site->fail("https://example.edu/slow", CURLE_OPERATION_TIMEDOUT, "Operation timed out");
        auto result = LinkChecker::checkLink("https://example.edu/slow", fetcher, config);
        REQUIRE(result.verdict == Verdict::BROKEN_LINK);
        REQUIRE_FALSE(result.status.has_value());
        REQUIRE(result.finalUrl.empty());
        REQUIRE(result.note == "Timeout: Operation timed out");
    }
}

TEST_CASE("LinkChecker memoizes through the cache", "[LinkChecker]") {
    auto site = std::make_shared<MockSite>();
    MockFetcher fetcher(site);
    CheckerConfig config;
    LinkCheckCache cache(10);

    site->status("https://example.edu/shared?x=1", 200);
    site->status("https://example.edu/shared?x=2", 404);

    SECTION("Query variants share one cache entry") {
        auto first = LinkChecker::checkLink("https://example.edu/shared?x=1", fetcher, config, &cache);
        auto second = LinkChecker::checkLink("https://example.edu/shared?x=2", fetcher, config, &cache);

        REQUIRE(site->calls("https://example.edu/shared?x=1") == 1);
        REQUIRE(site->calls("https://example.edu/shared?x=2") == 0);
        REQUIRE(second == first);
        REQUIRE(cache.stats().hits == 1);
        REQUIRE(cache.stats().misses == 1);
    }

    SECTION("Broken verdicts are cached too") {
        site->fail("https://example.edu/down", CURLE_COULDNT_CONNECT, "Connection refused");
        LinkChecker::checkLink("https://example.edu/down", fetcher, config, &cache);
        auto again = LinkChecker::checkLink("https://example.edu/down/", fetcher, config, &cache);

        REQUIRE(site->totalCalls() == 1);
        REQUIRE(again.verdict == Verdict::BROKEN_LINK);
        REQUIRE(again.note == "ConnectionError: Connection refused");
    }

    SECTION("Without a cache every check fetches") {
        LinkChecker::checkLink("https://example.edu/shared?x=1", fetcher, config);
        LinkChecker::checkLink("https://example.edu/shared?x=1", fetcher, config);
        REQUIRE(site->totalCalls() == 2);
    }
}
