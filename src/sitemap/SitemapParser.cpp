#include "SitemapParser.h"
#include "../crawler/FailureClassifier.h"
#include "../../include/Logger.h"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

// Owns a parsed libxml2 document
class XmlDocGuard {
public:
    explicit XmlDocGuard(xmlDocPtr doc) : doc(doc) {}
    ~XmlDocGuard() {
        if (doc) {
            xmlFreeDoc(doc);
        }
    }

    XmlDocGuard(const XmlDocGuard&) = delete;
    XmlDocGuard& operator=(const XmlDocGuard&) = delete;

    xmlDocPtr get() const { return doc; }
    explicit operator bool() const { return doc != nullptr; }

private:
    xmlDocPtr doc;
};

using XPathContextPtr = std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;

} // namespace

std::vector<std::string> SitemapParser::extractLocations(const std::string& xml) {
    std::vector<std::string> locations;
    if (xml.empty()) {
        return locations;
    }
    if (xml.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Sitemap too large to parse: " + std::to_string(xml.size()) + " bytes");
    }

    // Recover from markup errors; never load external entities or DTDs
    XmlDocGuard doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                                  XML_PARSE_RECOVER | XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                                  XML_PARSE_NONET | XML_PARSE_NOCDATA));
    if (!doc) {
        LOG_WARNING("Sitemap is not parseable as XML, no <loc> entries found");
        return locations;
    }

    XPathContextPtr context(xmlXPathNewContext(doc.get()), &xmlXPathFreeContext);
    if (!context) {
        throw std::runtime_error("Cannot create XPath context for sitemap");
    }
    XPathObjectPtr result(xmlXPathEvalExpression(BAD_CAST "//*[local-name()='loc']", context.get()),
                          &xmlXPathFreeObject);
    if (!result) {
        throw std::runtime_error("XPath evaluation failed on sitemap");
    }

    const xmlNodeSet* nodes = result->nodesetval;
    const int count = nodes ? nodes->nodeNr : 0;
    for (int i = 0; i < count; ++i) {
        xmlChar* content = xmlNodeGetContent(nodes->nodeTab[i]);
        if (!content) {
            continue;
        }
        std::string value = trim(reinterpret_cast<const char*>(content));
        xmlFree(content);

        if (!value.empty()) {
            locations.push_back(value);
        }
    }

    LOG_DEBUG("Sitemap contains " + std::to_string(locations.size()) + " <loc> entries");
    return locations;
}

std::string SitemapParser::normalizeLocation(const std::string& location) {
    std::string url = trim(location);
    if (url.rfind("http://", 0) == 0) {
        url = "https://" + url.substr(7);
    }
    size_t hash = url.find('#');
    if (hash != std::string::npos) {
        url.erase(hash);
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::vector<std::string> SitemapParser::normalizeAll(const std::vector<std::string>& locations) {
    std::vector<std::string> urls;
    std::unordered_set<std::string> seen;
    for (const auto& location : locations) {
        std::string url = normalizeLocation(location);
        if (url.empty()) {
            continue;
        }
        if (seen.insert(url).second) {
            urls.push_back(std::move(url));
        }
    }
    return urls;
}

std::string SitemapParser::loadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open sitemap file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string SitemapParser::download(const std::string& url, linkguard::crawler::HttpFetcher& fetcher) {
    LOG_INFO("Downloading sitemap " + url);
    auto response = fetcher.fetch(url);
    if (!response.responseReceived) {
        throw std::runtime_error("Sitemap download failed: " + FailureClassifier::describeTransportFailure(response));
    }
    if (response.statusCode >= 400) {
        throw std::runtime_error("Sitemap download failed: HTTP " + std::to_string(response.statusCode) + " for " + url);
    }
    return response.content;
}

void SitemapParser::writeUrlList(const std::string& csvPath, const std::vector<std::string>& urls) {
    std::filesystem::path path(csvPath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write URL list: " + csvPath);
    }
    out << "url\n";
    for (const auto& url : urls) {
        out << url << "\n";
    }
    if (!out) {
        throw std::runtime_error("Error while writing URL list: " + csvPath);
    }
}

std::vector<std::string> SitemapParser::readUrlList(const std::string& csvPath) {
    std::ifstream in(csvPath);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open URL list: " + csvPath);
    }

    std::vector<std::string> urls;
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        std::string url = trim(line);
        if (!url.empty()) {
            urls.push_back(url);
        }
    }
    return urls;
}
