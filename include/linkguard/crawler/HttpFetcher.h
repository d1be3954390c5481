#pragma once

#include <string>
#include <memory>
#include <functional>
#include <curl/curl.h>

namespace linkguard { namespace crawler {

struct PageFetchResult {
    // A response arrived; false means the transport failed (timeout, DNS, TLS, reset...)
    bool responseReceived = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string finalUrl;  // After redirects
    long redirectCount = 0;
    std::string errorMessage;
    CURLcode curlCode = CURLE_OK;
};

// Per-worker HTTP client. Implementations follow redirects and never throw
// for transport failures; those come back with responseReceived == false.
// Instances are not shared between threads.
class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;

    virtual PageFetchResult fetch(const std::string& url) = 0;
};

using FetcherFactory = std::function<std::unique_ptr<HttpFetcher>()>;

} } // namespace linkguard::crawler
