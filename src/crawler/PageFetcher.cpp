#include "PageFetcher.h"
#include "../../include/Logger.h"
#include "../../include/linkguard/common/UrlNormalizer.h"
#include <mutex>
#include <stdexcept>

using linkguard::crawler::PageFetchResult;

namespace {

// curl_global_init is not thread-safe; run it once before any worker exists
void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: " + std::string(curl_easy_strerror(rc)));
        }
    });
}

} // namespace

PageFetcher::PageFetcher(const std::string& userAgent,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds connectTimeout,
                         size_t maxRedirects)
    : curl(nullptr)
    , userAgent(userAgent)
    , timeout(timeout)
    , connectTimeout(connectTimeout)
    , maxRedirects(maxRedirects)
    , verifySSL(true) {
    LOG_DEBUG("PageFetcher constructor called with userAgent: " + userAgent);
    initCurl();
}

PageFetcher::~PageFetcher() {
    LOG_DEBUG("PageFetcher destructor called");
    cleanupCurl();
}

void PageFetcher::initCurl() {
    ensureCurlGlobalInit();
    curl = curl_easy_init();
    if (!curl) {
        LOG_ERROR("Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }
}

void PageFetcher::cleanupCurl() {
    if (curl) {
        curl_easy_cleanup(curl);
        curl = nullptr;
    }
}

PageFetchResult PageFetcher::fetch(const std::string& url) {
    const std::string cleanedUrl = linkguard::common::sanitizeUrl(url);
    LOG_DEBUG("PageFetcher::fetch called for URL: " + cleanedUrl);
    PageFetchResult result;

    if (!curl) {
        try {
            initCurl();
        } catch (const std::exception& e) {
            result.curlCode = CURLE_FAILED_INIT;
            result.errorMessage = e.what();
            return result;
        }
    }

    // Reset options but keep the connection cache and DNS cache of the handle
    curl_easy_reset(curl);

    char errbuf[CURL_ERROR_SIZE] = {0};
    std::string responseData;

    curl_easy_setopt(curl, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifySSL ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifySSL ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseData);

    struct curl_slist* headers = nullptr;
    for (const auto& header : customHeaders) {
        std::string headerStr = header.first + ": " + header.second;
        headers = curl_slist_append(headers, headerStr.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        result.curlCode = res;
        result.errorMessage = errbuf[0] != '\0' ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + result.errorMessage);
        return result;
    }

    result.responseReceived = true;

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        result.contentType = contentType;
    }

    char* finalUrl = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &finalUrl);
    result.finalUrl = finalUrl ? finalUrl : cleanedUrl;

    long redirects = 0;
    curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirects);
    result.redirectCount = redirects;

    result.content = std::move(responseData);

    if (result.statusCode >= 400) {
        LOG_DEBUG("HTTP " + std::to_string(result.statusCode) + " for URL: " + cleanedUrl);
    } else {
        LOG_TRACE("HTTP " + std::to_string(result.statusCode) + " for URL: " + cleanedUrl +
                  ", final URL: " + result.finalUrl + ", redirects: " + std::to_string(redirects));
    }

    return result;
}

void PageFetcher::setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers) {
    LOG_DEBUG("PageFetcher::setCustomHeaders called with " + std::to_string(headers.size()) + " headers");
    customHeaders = headers;
}

void PageFetcher::setVerifySSL(bool verify) {
    LOG_DEBUG("PageFetcher::setVerifySSL called with: " + std::string(verify ? "true" : "false"));
    verifySSL = verify;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* responseData = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    responseData->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}
