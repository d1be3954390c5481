#include "../../include/linkguard/common/UrlNormalizer.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace linkguard::common {

static inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static inline bool isInvisibleCodepoint(uint32_t cp) {
    return (cp >= 0x200B && cp <= 0x200F) ||
           (cp >= 0x202A && cp <= 0x202E) ||
           cp == 0x2060 ||
           (cp >= 0x2066 && cp <= 0x2069) ||
           cp == 0xFEFF;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string sanitizeUrl(const std::string& input) {
    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string out;
    out.reserve(end - start);

    for (size_t i = start; i < end;) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if ((c & 0x80) == 0) {
            if (c >= 0x20 && c != 0x7F) {
                out.push_back(static_cast<char>(c));
            }
            i++;
            continue;
        }

        // Decode just enough UTF-8 to recognise the invisible codepoints
        uint32_t cp = 0;
        size_t adv = 0;
        if ((c & 0xE0) == 0xC0 && i + 1 < end) {
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(input[i + 1]) & 0x3F);
            adv = 2;
        } else if ((c & 0xF0) == 0xE0 && i + 2 < end) {
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(input[i + 2]) & 0x3F);
            adv = 3;
        } else if ((c & 0xF8) == 0xF0 && i + 3 < end) {
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(input[i + 1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(input[i + 2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(input[i + 3]) & 0x3F);
            adv = 4;
        } else {
            // Stray continuation or truncated sequence
            i++;
            continue;
        }

        if (!isInvisibleCodepoint(cp)) {
            out.append(input, i, adv);
        }
        i += adv;
    }

    return out;
}

static bool isValidScheme(const std::string& candidate) {
    if (candidate.empty() || !std::isalpha(static_cast<unsigned char>(candidate[0]))) {
        return false;
    }
    return std::all_of(candidate.begin(), candidate.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parts;
    std::string rest = url;

    size_t colon = rest.find(':');
    size_t firstDelimiter = rest.find_first_of("/?#");
    if (colon != std::string::npos && (firstDelimiter == std::string::npos || colon < firstDelimiter)) {
        std::string candidate = rest.substr(0, colon);
        if (isValidScheme(candidate)) {
            parts.scheme = toLower(candidate);
            rest = rest.substr(colon + 1);
        }
    }

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        parts.hasFragment = true;
        parts.fragment = rest.substr(hash + 1);
        rest.resize(hash);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        parts.hasQuery = true;
        parts.query = rest.substr(question + 1);
        rest.resize(question);
    }

    if (rest.rfind("//", 0) == 0) {
        parts.hasAuthority = true;
        size_t pathStart = rest.find('/', 2);
        if (pathStart == std::string::npos) {
            parts.netloc = rest.substr(2);
        } else {
            parts.netloc = rest.substr(2, pathStart - 2);
            parts.path = rest.substr(pathStart);
        }
    } else {
        parts.path = rest;
    }

    return parts;
}

std::string composeUrl(const ParsedUrl& parts) {
    std::string out;
    if (!parts.scheme.empty()) {
        out += parts.scheme + ":";
    }
    if (parts.hasAuthority) {
        out += "//" + parts.netloc;
    }
    out += parts.path;
    if (parts.hasQuery) {
        out += "?" + parts.query;
    }
    if (parts.hasFragment) {
        out += "#" + parts.fragment;
    }
    return out;
}

// RFC 3986 section 5.2.4
static std::string removeDotSegments(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    std::vector<std::string> output;
    bool absolute = path[0] == '/';
    size_t pos = absolute ? 1 : 0;
    bool trailingSlash = false;

    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        std::string segment = path.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        bool last = next == std::string::npos;

        if (segment == ".") {
            trailingSlash = last;
        } else if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
            }
            trailingSlash = last;
        } else {
            output.push_back(segment);
            trailingSlash = false;
        }

        if (last) {
            break;
        }
        pos = next + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < output.size(); ++i) {
        if (i > 0) {
            result += "/";
        }
        result += output[i];
    }
    if (trailingSlash && (result.empty() || result.back() != '/')) {
        result += "/";
    }
    return result;
}

static std::string mergePaths(const ParsedUrl& base, const std::string& referencePath) {
    if (base.hasAuthority && base.path.empty()) {
        return "/" + referencePath;
    }
    size_t lastSlash = base.path.rfind('/');
    if (lastSlash == std::string::npos) {
        return referencePath;
    }
    return base.path.substr(0, lastSlash + 1) + referencePath;
}

std::string resolveUrl(const std::string& baseUrl, const std::string& reference) {
    ParsedUrl base = parseUrl(baseUrl);
    ParsedUrl ref = parseUrl(reference);
    ParsedUrl target;

    if (!ref.scheme.empty()) {
        target = ref;
        target.path = removeDotSegments(ref.path);
        return composeUrl(target);
    }

    if (ref.hasAuthority) {
        target.hasAuthority = true;
        target.netloc = ref.netloc;
        target.path = removeDotSegments(ref.path);
        target.hasQuery = ref.hasQuery;
        target.query = ref.query;
    } else {
        if (ref.path.empty()) {
            target.path = base.path;
            if (ref.hasQuery) {
                target.hasQuery = true;
                target.query = ref.query;
            } else {
                target.hasQuery = base.hasQuery;
                target.query = base.query;
            }
        } else {
            if (ref.path[0] == '/') {
                target.path = removeDotSegments(ref.path);
            } else {
                target.path = removeDotSegments(mergePaths(base, ref.path));
            }
            target.hasQuery = ref.hasQuery;
            target.query = ref.query;
        }
        target.hasAuthority = base.hasAuthority;
        target.netloc = base.netloc;
    }

    target.scheme = base.scheme;
    target.hasFragment = ref.hasFragment;
    target.fragment = ref.fragment;
    return composeUrl(target);
}

std::string extractHost(const std::string& url) {
    std::string host = parseUrl(url).netloc;

    size_t at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }

    if (!host.empty() && host[0] == '[') {
        size_t close = host.find(']');
        return toLower(close == std::string::npos ? host : host.substr(0, close + 1));
    }

    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        host.resize(colon);
    }
    return toLower(host);
}

static std::string stripTrailingSlashes(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string comparisonForm(const std::string& url) {
    ParsedUrl parts = parseUrl(url);
    std::string path = parts.path.empty() ? "/" : parts.path;
    std::string out = parts.scheme + "://" + toLower(parts.netloc) + stripTrailingSlashes(path);
    if (!parts.query.empty()) {
        out += "?" + parts.query;
    }
    return out;
}

std::string cacheKeyForm(const std::string& url) {
    ParsedUrl parts = parseUrl(url);
    std::string path = parts.path.empty() ? "/" : parts.path;
    return parts.scheme + "://" + toLower(parts.netloc) + stripTrailingSlashes(path);
}

bool hostMatchesSuffix(const std::string& host, const std::string& suffix) {
    if (suffix.empty()) {
        return false;
    }
    std::string h = toLower(host);
    std::string s = toLower(suffix);
    return h.size() >= s.size() && h.compare(h.size() - s.size(), s.size(), s) == 0;
}

std::string truncateMessage(const std::string& text, size_t maxLength) {
    if (text.size() <= maxLength) {
        return text;
    }
    return text.substr(0, maxLength);
}

} // namespace linkguard::common
