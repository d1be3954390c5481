#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <curl/curl.h>
#include "../../include/linkguard/crawler/HttpFetcher.h"

// libcurl-backed HttpFetcher. Owns one easy handle for its whole lifetime so
// consecutive requests of the same worker reuse open connections.
class PageFetcher : public linkguard::crawler::HttpFetcher {
public:
    PageFetcher(const std::string& userAgent,
                std::chrono::milliseconds timeout,
                std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(10000),
                size_t maxRedirects = 10);
    ~PageFetcher() override;

    PageFetcher(const PageFetcher&) = delete;
    PageFetcher& operator=(const PageFetcher&) = delete;

    // GET with redirects followed
    linkguard::crawler::PageFetchResult fetch(const std::string& url) override;

    // Set custom headers
    void setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers);

    // Enable/disable SSL verification
    void setVerifySSL(bool verify);

private:
    void initCurl();
    void cleanupCurl();

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    CURL* curl;
    std::string userAgent;
    std::chrono::milliseconds timeout;
    std::chrono::milliseconds connectTimeout;
    size_t maxRedirects;
    std::vector<std::pair<std::string, std::string>> customHeaders;
    bool verifySSL;
};
