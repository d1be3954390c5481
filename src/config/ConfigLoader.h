#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../crawler/models/CrawlConfig.h"

// Reads config.json into a validated CrawlConfig. Every recognized key is
// optional and falls back to the CrawlConfig default; a key of the wrong type
// or out of range raises ConfigurationError naming the key.
class ConfigLoader {
public:
    static constexpr const char* kDefaultPath = "config.json";

    // Path from the command line, else $LINKGUARD_CONFIG, else config.json
    static std::string resolvePath(const std::string& commandLinePath);

    // Parse, apply environment overrides and validate
    static CrawlConfig loadFromFile(const std::string& path);

    static CrawlConfig fromJson(const nlohmann::json& root);

    // LINKGUARD_THREADS and LINKGUARD_LOG_LEVEL
    static void applyEnvironment(CrawlConfig& config);
};
