#pragma once

#include <string>
#include <exception>
#include <curl/curl.h>
#include "../../include/linkguard/crawler/HttpFetcher.h"

class FailureClassifier {
public:
    /**
     * Name the kind of a transport failure
     * @param curlCode CURL error code of the failed transfer
     * @return "Timeout", "ConnectionError", "DNSResolutionError", "SSLError",
     *         "TooManyRedirects", "InvalidURL" or "TransportError"
     */
    static std::string transportErrorKind(CURLcode curlCode);

    /**
     * Render a failed fetch as "<kind>: <message>" with the message cut to 120 bytes
     */
    static std::string describeTransportFailure(const linkguard::crawler::PageFetchResult& result);

    /**
     * Render an exception caught at the page boundary as "<kind>: <message>"
     */
    static std::string describeException(const std::exception& e);

private:
    static std::string exceptionKind(const std::exception& e);
};
