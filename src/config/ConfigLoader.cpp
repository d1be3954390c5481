#include "ConfigLoader.h"
#include "../../include/Logger.h"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <vector>

using nlohmann::json;

namespace {

std::string keyPath(const std::string& prefix, const char* key) {
    return prefix.empty() ? std::string(key) : prefix + "." + key;
}

const json* findKey(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

void readBool(const json& object, const char* key, const std::string& prefix, bool& target) {
    const json* value = findKey(object, key);
    if (!value) return;
    if (!value->is_boolean()) {
        throw ConfigurationError(keyPath(prefix, key) + ": expected a boolean");
    }
    target = value->get<bool>();
}

void readString(const json& object, const char* key, const std::string& prefix, std::string& target) {
    const json* value = findKey(object, key);
    if (!value) return;
    if (!value->is_string()) {
        throw ConfigurationError(keyPath(prefix, key) + ": expected a string");
    }
    target = value->get<std::string>();
}

long long readInteger(const json& value, const std::string& name, long long minimum,
                      long long maximum = std::numeric_limits<long long>::max()) {
    if (!value.is_number_integer()) {
        throw ConfigurationError(name + ": expected an integer");
    }
    long long number = value.get<long long>();
    if (number < minimum) {
        throw ConfigurationError(name + ": must be at least " + std::to_string(minimum) +
                                 ", got " + std::to_string(number));
    }
    if (number > maximum) {
        throw ConfigurationError(name + ": must be at most " + std::to_string(maximum) +
                                 ", got " + std::to_string(number));
    }
    return number;
}

void readSize(const json& object, const char* key, const std::string& prefix, size_t& target, long long minimum = 0,
              long long maximum = std::numeric_limits<long long>::max()) {
    const json* value = findKey(object, key);
    if (!value) return;
    target = static_cast<size_t>(readInteger(*value, keyPath(prefix, key), minimum, maximum));
}

// Seconds as int or float, stored as milliseconds
void readSeconds(const json& object, const char* key, const std::string& prefix,
                 std::chrono::milliseconds& target, bool allowZero) {
    const json* value = findKey(object, key);
    if (!value) return;
    if (!value->is_number()) {
        throw ConfigurationError(keyPath(prefix, key) + ": expected a number of seconds");
    }
    double seconds = value->get<double>();
    if (seconds < 0.0 || (!allowZero && seconds == 0.0)) {
        throw ConfigurationError(keyPath(prefix, key) + (allowZero ? ": must not be negative" : ": must be positive"));
    }
    if (seconds > static_cast<double>(kMaxDuration.count())) {
        throw ConfigurationError(keyPath(prefix, key) + ": must be at most " +
                                 std::to_string(kMaxDuration.count()) + " seconds");
    }
    target = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

void readStringList(const json& object, const char* key, const std::string& prefix, std::vector<std::string>& target) {
    const json* value = findKey(object, key);
    if (!value) return;
    if (!value->is_array()) {
        throw ConfigurationError(keyPath(prefix, key) + ": expected a list of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : *value) {
        if (!item.is_string()) {
            throw ConfigurationError(keyPath(prefix, key) + ": expected a list of strings");
        }
        items.push_back(item.get<std::string>());
    }
    target = std::move(items);
}

const json* findSection(const json& root, const char* key) {
    const json* section = findKey(root, key);
    if (section && !section->is_object()) {
        throw ConfigurationError(std::string(key) + ": expected an object");
    }
    return section;
}

} // namespace

std::string ConfigLoader::resolvePath(const std::string& commandLinePath) {
    if (!commandLinePath.empty()) {
        return commandLinePath;
    }
    const char* fromEnv = std::getenv("LINKGUARD_CONFIG");
    if (fromEnv && *fromEnv) {
        return fromEnv;
    }
    return kDefaultPath;
}

CrawlConfig ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError("Cannot open configuration file: " + path);
    }

    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Malformed configuration file " + path + ": " + e.what());
    }

    CrawlConfig config = fromJson(root);
    applyEnvironment(config);
    validateConfig(config);

    LOG_DEBUG("Loaded configuration from " + path);
    return config;
}

CrawlConfig ConfigLoader::fromJson(const json& root) {
    if (!root.is_object()) {
        throw ConfigurationError("configuration root must be an object");
    }

    CrawlConfig config;

    readSize(root, "threads", "", config.threads, 1, static_cast<long long>(kMaxThreads));
    readSeconds(root, "delay", "", config.delay, true);
    readSeconds(root, "timeout", "", config.requestTimeout, false);
    readSeconds(root, "connect_timeout", "", config.connectTimeout, false);
    readSize(root, "max_redirects", "", config.maxRedirects);
    readString(root, "user_agent", "", config.userAgent);
    readBool(root, "verify_ssl", "", config.verifySsl);
    if (const json* headers = findSection(root, "extra_headers")) {
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            if (!it.value().is_string()) {
                throw ConfigurationError("extra_headers." + it.key() + ": expected a string");
            }
            config.extraHeaders.emplace_back(it.key(), it.value().get<std::string>());
        }
    }
    readStringList(root, "domain_allowlist", "", config.domainAllowlist);
    readBool(root, "extract_links", "", config.extractLinks);
    readBool(root, "count_duplicates", "", config.countDuplicates);
    readSize(root, "max_urls", "", config.maxUrls);

    std::string scheduler;
    readString(root, "scheduler", "", scheduler);
    if (!scheduler.empty()) {
        config.scheduler = parseSchedulerMode(scheduler);
    }

    if (const json* checker = findSection(root, "checker")) {
        readBool(*checker, "treat_redirect_as_ok", "checker", config.checker.treatRedirectAsOk);
        readStringList(*checker, "cascade_login_patterns", "checker", config.checker.cascadeLoginPatterns);
        readSize(*checker, "max_links_per_page", "checker", config.checker.maxLinksPerPage);
    }

    if (const json* cache = findSection(root, "cache")) {
        std::string mode;
        readString(*cache, "mode", "cache", mode);
        if (!mode.empty()) {
            config.cache.mode = parseCacheMode(mode);
        }
        if (const json* maxSize = findKey(*cache, "max_size")) {
            config.cache.maxSize = readInteger(*maxSize, "cache.max_size", 1);
        }
    }

    readString(root, "data_dir", "", config.dataDir);
    readString(root, "output_dir", "", config.outputDir);

    std::string delimiter;
    readString(root, "csv_delimiter", "", delimiter);
    if (!delimiter.empty()) {
        if (delimiter.size() != 1 || delimiter[0] == '"' || delimiter[0] == '\n') {
            throw ConfigurationError("csv_delimiter: expected a single character other than quote or newline");
        }
        config.csvDelimiter = delimiter[0];
    }
    readBool(root, "csv_decimal_comma", "", config.csvDecimalComma);

    readString(root, "sitemap_url", "", config.sitemapUrl);
    readBool(root, "mock_mode", "", config.mockMode);
    if (const json* mock = findSection(root, "mock")) {
        readString(*mock, "sitemap_path", "mock", config.mock.sitemapPath);
        readString(*mock, "sample_page_path", "mock", config.mock.samplePagePath);
        readString(*mock, "sample_page_url", "mock", config.mock.samplePageUrl);
    }

    readString(root, "log_level", "", config.logLevel);
    readString(root, "log_file", "", config.logFile);

    return config;
}

void ConfigLoader::applyEnvironment(CrawlConfig& config) {
    if (const char* threads = std::getenv("LINKGUARD_THREADS")) {
        std::string value(threads);
        if (!value.empty()) {
            if (value.find_first_not_of("0123456789") != std::string::npos) {
                throw ConfigurationError("LINKGUARD_THREADS: expected a positive integer, got \"" + value + "\"");
            }
            try {
                config.threads = static_cast<size_t>(std::stoul(value));
            } catch (const std::out_of_range&) {
                throw ConfigurationError("LINKGUARD_THREADS: value out of range");
            }
            LOG_DEBUG("threads overridden by LINKGUARD_THREADS: " + value);
        }
    }

    if (const char* level = std::getenv("LINKGUARD_LOG_LEVEL")) {
        if (*level) {
            config.logLevel = level;
        }
    }
}
