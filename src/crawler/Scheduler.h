#pragma once

#include <string>
#include <vector>
#include "models/CrawlConfig.h"

// Orders the seed list before it enters the frontier. Pure and
// deterministic; never drops or adds URLs.
class Scheduler {
public:
    static std::vector<std::string> orderURLs(const std::vector<std::string>& urls, SchedulerMode mode);

    // Lower score crawls earlier: path depth, plus 2 when a query is present
    static int priorityScore(const std::string& url);

    // Number of '/' characters in the URL path
    static int pathDepth(const std::string& url);
};
