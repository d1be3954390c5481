#include "CrawlConfig.h"
#include "../../../include/Logger.h"
#include "../../../include/linkguard/common/UrlNormalizer.h"

std::string toString(SchedulerMode mode) {
    switch (mode) {
        case SchedulerMode::FIFO: return "fifo";
        case SchedulerMode::PRIORITY: return "priority";
    }
    return "fifo";
}

std::string toString(CacheMode mode) {
    switch (mode) {
        case CacheMode::NONE: return "none";
        case CacheMode::LRU: return "lru";
    }
    return "none";
}

SchedulerMode parseSchedulerMode(const std::string& value) {
    std::string lowered = linkguard::common::toLower(value);
    if (lowered == "fifo") return SchedulerMode::FIFO;
    if (lowered == "priority") return SchedulerMode::PRIORITY;
    throw ConfigurationError("scheduler: expected \"fifo\" or \"priority\", got \"" + value + "\"");
}

CacheMode parseCacheMode(const std::string& value) {
    std::string lowered = linkguard::common::toLower(value);
    if (lowered == "none") return CacheMode::NONE;
    if (lowered == "lru") return CacheMode::LRU;
    throw ConfigurationError("cache.mode: expected \"none\" or \"lru\", got \"" + value + "\"");
}

void validateConfig(const CrawlConfig& config) {
    if (config.threads == 0) {
        throw ConfigurationError("threads: must be at least 1");
    }
    if (config.threads > kMaxThreads) {
        throw ConfigurationError("threads: must be at most " + std::to_string(kMaxThreads) +
                                 ", got " + std::to_string(config.threads));
    }
    if (config.delay.count() < 0) {
        throw ConfigurationError("delay: must not be negative");
    }
    if (config.requestTimeout.count() <= 0) {
        throw ConfigurationError("timeout: must be positive");
    }
    if (config.connectTimeout.count() <= 0) {
        throw ConfigurationError("connect_timeout: must be positive");
    }
    if (config.delay > kMaxDuration || config.requestTimeout > kMaxDuration || config.connectTimeout > kMaxDuration) {
        throw ConfigurationError("delay, timeout and connect_timeout must be at most " +
                                 std::to_string(kMaxDuration.count()) + " seconds");
    }
    if (config.userAgent.empty()) {
        throw ConfigurationError("user_agent: must not be empty");
    }
    if (config.cache.mode == CacheMode::LRU && config.cache.maxSize <= 0) {
        throw ConfigurationError("cache.max_size: must be positive when cache.mode is lru, got " +
                                 std::to_string(config.cache.maxSize));
    }
    if (config.domainAllowlist.empty() && config.extractLinks) {
        LOG_WARNING("domain_allowlist is empty, no link will be in scope");
    }
}
