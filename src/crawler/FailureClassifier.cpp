#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/linkguard/common/UrlNormalizer.h"
#include <new>
#include <stdexcept>
#include <system_error>
#include <typeinfo>

std::string FailureClassifier::transportErrorKind(CURLcode curlCode) {
    switch (curlCode) {
        case CURLE_OPERATION_TIMEDOUT:
            return "Timeout";
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return "DNSResolutionError";
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return "ConnectionError";
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return "SSLError";
        case CURLE_TOO_MANY_REDIRECTS:
            return "TooManyRedirects";
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return "InvalidURL";
        default:
            return "TransportError";
    }
}

std::string FailureClassifier::describeTransportFailure(const linkguard::crawler::PageFetchResult& result) {
    std::string message = result.errorMessage;
    if (message.empty()) {
        message = curl_easy_strerror(result.curlCode);
    }
    std::string kind = transportErrorKind(result.curlCode);
    LOG_DEBUG("Classified transport failure (CURL " + std::to_string(static_cast<int>(result.curlCode)) +
              ") as " + kind);
    return kind + ": " + linkguard::common::truncateMessage(message, 120);
}

std::string FailureClassifier::describeException(const std::exception& e) {
    return exceptionKind(e) + ": " + linkguard::common::truncateMessage(e.what(), 120);
}

std::string FailureClassifier::exceptionKind(const std::exception& e) {
    if (dynamic_cast<const std::bad_alloc*>(&e)) return "BadAlloc";
    if (dynamic_cast<const std::out_of_range*>(&e)) return "OutOfRange";
    if (dynamic_cast<const std::invalid_argument*>(&e)) return "InvalidArgument";
    if (dynamic_cast<const std::length_error*>(&e)) return "LengthError";
    if (dynamic_cast<const std::logic_error*>(&e)) return "LogicError";
    if (dynamic_cast<const std::system_error*>(&e)) return "SystemError";
    if (dynamic_cast<const std::runtime_error*>(&e)) return "RuntimeError";
    return "Exception";
}
