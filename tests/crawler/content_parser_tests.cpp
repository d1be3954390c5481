#include <catch2/catch_test_macros.hpp>
#include "ContentParser.h"
#include <algorithm>

namespace {

const std::vector<std::string> kAllow = {"example.edu"};

bool containsLink(const std::vector<std::string>& links, const std::string& link) {
    return std::find(links.begin(), links.end(), link) != links.end();
}

} // namespace

TEST_CASE("ContentParser finds the main content region", "[ContentParser]") {
    SECTION("Prefers <main>") {
        HtmlDocument doc("<html><body><div id=\"content\"></div><main id=\"m\"></main></body></html>");
        const GumboNode* main = ContentParser::findMainRegion(doc.root());
        REQUIRE(main != nullptr);
        REQUIRE(main->v.element.tag == GUMBO_TAG_MAIN);
    }

    SECTION("Falls back to #content, then .content") {
        HtmlDocument byId("<html><body><div class=\"content\"></div><section id=\"content\"></section></body></html>");
        const GumboNode* region = ContentParser::findMainRegion(byId.root());
        REQUIRE(region != nullptr);
        REQUIRE(region->v.element.tag == GUMBO_TAG_SECTION);

        HtmlDocument byClass("<html><body><div class=\"wide content\"><a href=\"/x\">x</a></div></body></html>");
        REQUIRE(ContentParser::findMainRegion(byClass.root()) != nullptr);
    }

    SECTION("Ignores candidates inside site chrome") {
        HtmlDocument doc("<html><body><header><main></main></header></body></html>");
        REQUIRE(ContentParser::findMainRegion(doc.root()) == nullptr);
    }

    SECTION("Returns nullptr when there is no landmark") {
        HtmlDocument doc("<html><body><p>plain</p></body></html>");
        REQUIRE(ContentParser::findMainRegion(doc.root()) == nullptr);
    }
}

TEST_CASE("ContentParser extracts in-scope links", "[ContentParser]") {
    ContentParser parser;
    const std::string pageUrl = "https://www.example.edu/dept/index.html";

    SECTION("Only the main region counts, chrome is skipped") {
        std::string html =
            "<html><body>"
            "<header><a href=\"/header-link\">h</a></header>"
            "<nav><a href=\"/nav-link\">n</a></nav>"
            "<main>"
            "  <a href=\"/a\">a</a>"
            "  <div class=\"global-nav\"><a href=\"/global\">g</a></div>"
            "  <aside><a href=\"/aside\">s</a></aside>"
            "  <a href=\"b/\">b</a>"
            "</main>"
            "<footer><a href=\"/footer-link\">f</a></footer>"
            "</body></html>";

        auto extracted = parser.extractInternalLinks(pageUrl, html, kAllow);
        REQUIRE(extracted.links == std::vector<std::string>{
            "https://www.example.edu/a",
            "https://www.example.edu/dept/b",
        });
        REQUIRE(extracted.count == 2);
    }

    SECTION("Whole document is searched when there is no main region") {
        std::string html = "<html><body><p><a href=\"/a\">a</a></p><footer><a href=\"/f\">f</a></footer></body></html>";
        auto extracted = parser.extractInternalLinks(pageUrl, html, kAllow);
        REQUIRE(extracted.links == std::vector<std::string>{"https://www.example.edu/a"});
    }

    SECTION("Out-of-scope hosts and skipped schemes are dropped") {
        std::string html =
            "<main>"
            "<a href=\"https://other.org/x\">o</a>"
            "<a href=\"tel:+491234\">t</a>"
            "<a href=\"javascript:void(0)\">j</a>"
            "<a href=\"data:text/plain,hi\">d</a>"
            "<a href=\"ftp://files.example.edu/x\">f</a>"
            "<a href=\"https://news.example.edu/item?id=4#top\">n</a>"
            "</main>";
        auto extracted = parser.extractInternalLinks(pageUrl, html, kAllow);
        REQUIRE(extracted.links == std::vector<std::string>{"https://news.example.edu/item"});
    }

    SECTION("Links without a path are skipped") {
        std::string html = "<main><a href=\"https://example.edu\">r</a><a href=\"https://example.edu/\">s</a></main>";
        auto extracted = parser.extractInternalLinks(pageUrl, html, kAllow);
        REQUIRE(extracted.links == std::vector<std::string>{"https://example.edu"});
    }

    SECTION("mailto links are kept when the address domain is in scope") {
        std::string html =
            "<main>"
            "<a href=\"mailto:Info@Example.edu\">i</a>"
            "<a href=\"mailto:someone@gmail.com\">g</a>"
            "</main>";
        auto extracted = parser.extractInternalLinks(pageUrl, html, kAllow);
        REQUIRE(extracted.links == std::vector<std::string>{"mailto:info@example.edu"});
        REQUIRE(extracted.count == 1);
    }

    SECTION("Duplicates count per occurrence unless disabled") {
        std::string html = "<main><a href=\"/a\">1</a><a href=\"/a/\">2</a><a href=\"/a?x=1\">3</a><a href=\"/b\">4</a></main>";

        auto counted = parser.extractInternalLinks(pageUrl, html, kAllow, true);
        REQUIRE(counted.links.size() == 4);
        REQUIRE(counted.count == 4);

        auto unique = parser.extractInternalLinks(pageUrl, html, kAllow, false);
        REQUIRE(unique.links.size() == 4);
        REQUIRE(unique.count == 2);
    }

    SECTION("Empty allow-list keeps nothing") {
        std::string html = "<main><a href=\"/a\">a</a></main>";
        auto extracted = parser.extractInternalLinks(pageUrl, html, {});
        REQUIRE(extracted.links.empty());
        REQUIRE(extracted.count == 0);
    }

    SECTION("Malformed markup is handled permissively") {
        std::string html = "<main><a href=\"/ok\">ok<a href><div><a href=\"   \">blank</a>";
        auto extracted = parser.extractInternalLinks(pageUrl, html, kAllow);
        REQUIRE(containsLink(extracted.links, "https://www.example.edu/ok"));
    }
}

TEST_CASE("ContentParser partitions all links of a page", "[ContentParser]") {
    ContentParser parser;
    std::string html =
        "<html><body>"
        "<nav><a href=\"/about\">about</a></nav>"
        "<a href=\"https://partner.org/\">p</a>"
        "<a href=\"/about\">again</a>"
        "<a href=\"contact\">c</a>"
        "</body></html>";

    auto partition = parser.partitionLinks("https://www.example.edu/", html, kAllow);

    REQUIRE(partition.internal == std::vector<std::string>{
        "https://www.example.edu/about",
        "https://www.example.edu/contact",
    });
    REQUIRE(partition.external == std::vector<std::string>{"https://partner.org/"});
}
