#pragma once

#include <string>
#include <vector>
#include "../../include/linkguard/crawler/HttpFetcher.h"

// Turns a sitemap into the crawl's seed list and persists it as
// <data_dir>/urls_initial.csv (one "url" header line, one URL per line).
class SitemapParser {
public:
    // Text of every <loc> element in document order, in any namespace. Parsed with
    // libxml2, so comments are skipped and entity and character references decoded.
    static std::vector<std::string> extractLocations(const std::string& xml);

    // Trim, upgrade http:// to https://, drop the fragment, strip trailing slashes
    static std::string normalizeLocation(const std::string& location);

    // Normalize every location and keep the first occurrence of each
    static std::vector<std::string> normalizeAll(const std::vector<std::string>& locations);

    // Read a sitemap from disk; throws std::runtime_error if unreadable
    static std::string loadFile(const std::string& path);

    // GET a sitemap; throws std::runtime_error on transport failure or status >= 400
    static std::string download(const std::string& url, linkguard::crawler::HttpFetcher& fetcher);

    static void writeUrlList(const std::string& csvPath, const std::vector<std::string>& urls);

    // Seed URLs from a file written by writeUrlList, blank lines skipped
    static std::vector<std::string> readUrlList(const std::string& csvPath);
};
