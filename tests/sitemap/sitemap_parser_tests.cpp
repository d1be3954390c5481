#include <catch2/catch_test_macros.hpp>
#include "sitemap/SitemapParser.h"
#include "support/MockFetcher.h"
#include <filesystem>
#include <stdexcept>

TEST_CASE("SitemapParser extracts locations", "[SitemapParser]") {
    const std::string xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<urlset xmlns="http://www.sitemaps.org/schemas/sitemap/0.9"
        xmlns:sm="http://www.sitemaps.org/schemas/sitemap/0.9">
  <url><loc> https://example.edu/a </loc><lastmod>2024-01-01</lastmod></url>
  <url><loc>https://example.edu/search?q=1&amp;p=2</loc></url>
  <url><sm:loc>https://example.edu/prefixed</sm:loc></url>
  <url><loc><![CDATA[https://example.edu/cdata]]></loc></url>
  <url><loc></loc></url>
</urlset>)";

    auto locations = SitemapParser::extractLocations(xml);
    REQUIRE(locations == std::vector<std::string>{
        "https://example.edu/a",
        "https://example.edu/search?q=1&p=2",
        "https://example.edu/prefixed",
        "https://example.edu/cdata",
    });
}

TEST_CASE("SitemapParser reads sitemaps as XML", "[SitemapParser]") {
    SECTION("Commented-out entries are not locations") {
        const std::string xml =
            "<urlset><!-- retired: <url><loc>https://example.edu/retired</loc></url> -->"
            "<url><loc>https://example.edu/search?a=1&#38;b=2</loc></url></urlset>";

        REQUIRE(SitemapParser::extractLocations(xml) ==
                std::vector<std::string>{"https://example.edu/search?a=1&b=2"});
    }

    SECTION("Character references are decoded") {
        const std::string xml = "<urlset><url><loc>https://example.edu/caf&#xE9;?x=&#60;1&#62;</loc></url></urlset>";

        REQUIRE(SitemapParser::extractLocations(xml) ==
                std::vector<std::string>{"https://example.edu/caf\xC3\xA9?x=<1>"});
    }

    SECTION("Empty and non-sitemap input yield no locations") {
        REQUIRE(SitemapParser::extractLocations("").empty());
        REQUIRE(SitemapParser::extractLocations("<html><body>Not found</body></html>").empty());
    }
}

TEST_CASE("SitemapParser normalizes and de-duplicates", "[SitemapParser]") {
    REQUIRE(SitemapParser::normalizeLocation("http://example.edu/a/") == "https://example.edu/a");
    REQUIRE(SitemapParser::normalizeLocation("https://example.edu/a#section") == "https://example.edu/a");
    REQUIRE(SitemapParser::normalizeLocation("  https://example.edu/  ") == "https://example.edu");

    auto urls = SitemapParser::normalizeAll({
        "https://example.edu/b",
        "http://example.edu/a",
        "https://example.edu/b/",
        "https://example.edu/a#x",
    });
    REQUIRE(urls == std::vector<std::string>{"https://example.edu/b", "https://example.edu/a"});
}

TEST_CASE("SitemapParser persists the seed list", "[SitemapParser]") {
    auto dir = std::filesystem::temp_directory_path() / "linkguard_sitemap_test";
    std::filesystem::remove_all(dir);
    auto path = (dir / "data" / "urls_initial.csv").string();

    SitemapParser::writeUrlList(path, {"https://example.edu/a", "https://example.edu/b"});
    REQUIRE(SitemapParser::readUrlList(path) ==
            std::vector<std::string>{"https://example.edu/a", "https://example.edu/b"});

    REQUIRE_THROWS_AS(SitemapParser::readUrlList((dir / "missing.csv").string()), std::runtime_error);
    REQUIRE_THROWS_AS(SitemapParser::loadFile((dir / "missing.xml").string()), std::runtime_error);

    std::filesystem::remove_all(dir);
}

TEST_CASE("SitemapParser downloads through a fetcher", "[SitemapParser]") {
    auto site = std::make_shared<MockSite>();
    MockFetcher fetcher(site);

    site->page("https://example.edu/sitemap.xml", "<urlset><url><loc>https://example.edu/x</loc></url></urlset>");
    site->status("https://example.edu/gone.xml", 404);

    std::string xml = SitemapParser::download("https://example.edu/sitemap.xml", fetcher);
    REQUIRE(SitemapParser::extractLocations(xml) == std::vector<std::string>{"https://example.edu/x"});

    REQUIRE_THROWS_AS(SitemapParser::download("https://example.edu/gone.xml", fetcher), std::runtime_error);
    REQUIRE_THROWS_AS(SitemapParser::download("https://unknown.example.edu/sitemap.xml", fetcher), std::runtime_error);
}
