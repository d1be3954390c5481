#pragma once

#include <string>
#include <cstddef>

namespace linkguard::common {

// Components of a URL split per RFC 3986 section 3. The has* flags keep
// "http://a/b?" (empty query) distinguishable from "http://a/b" (no query).
struct ParsedUrl {
    std::string scheme;     // lowercased
    std::string netloc;     // userinfo@host:port, as written
    std::string path;
    std::string query;
    std::string fragment;
    bool hasAuthority = false;
    bool hasQuery = false;
    bool hasFragment = false;
};

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// (U+200B..U+200F, U+202A..U+202E, U+2060, U+2066..U+2069, U+FEFF), strip ASCII
// control characters and trim surrounding ASCII whitespace.
std::string sanitizeUrl(const std::string& input);

// Split a URL into its components. Never throws; anything unparseable ends up
// in the path.
ParsedUrl parseUrl(const std::string& url);

// Reassemble components. composeUrl(parseUrl(u)) == u for well-formed u,
// except that the scheme comes back lowercased.
std::string composeUrl(const ParsedUrl& parts);

// Resolve a reference against a base URL (RFC 3986 section 5.2).
std::string resolveUrl(const std::string& baseUrl, const std::string& reference);

// Lowercased host without userinfo and port
std::string extractHost(const std::string& url);

// Form used to decide whether a fetch ended on a different URL:
// lowercased scheme and host, trailing slashes stripped, fragment dropped,
// query kept verbatim.
std::string comparisonForm(const std::string& url);

// Form used as the link-check cache key: like comparisonForm but the query is
// dropped too, so tracking-parameter variants share one entry.
std::string cacheKeyForm(const std::string& url);

// True if host equals or ends with one of the domain suffixes (case-insensitive)
bool hostMatchesSuffix(const std::string& host, const std::string& suffix);

// Cut diagnostics to at most maxLength bytes
std::string truncateMessage(const std::string& text, size_t maxLength = 120);

std::string toLower(std::string value);

} // namespace linkguard::common
