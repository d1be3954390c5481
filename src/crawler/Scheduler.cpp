#include "Scheduler.h"
#include "../../include/Logger.h"
#include "../../include/linkguard/common/UrlNormalizer.h"
#include <algorithm>
#include <utility>

int Scheduler::pathDepth(const std::string& url) {
    const std::string path = linkguard::common::parseUrl(url).path;
    return static_cast<int>(std::count(path.begin(), path.end(), '/'));
}

int Scheduler::priorityScore(const std::string& url) {
    int score = pathDepth(url);
    if (!linkguard::common::parseUrl(url).query.empty()) {
        score += 2;
    }
    return score;
}

std::vector<std::string> Scheduler::orderURLs(const std::vector<std::string>& urls, SchedulerMode mode) {
    if (mode == SchedulerMode::FIFO) {
        return urls;
    }

    // Precompute keys so the comparator stays cheap on large sitemaps
    std::vector<std::pair<std::pair<int, size_t>, const std::string*>> keyed;
    keyed.reserve(urls.size());
    for (const auto& url : urls) {
        keyed.push_back({{priorityScore(url), url.size()}, &url});
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    std::vector<std::string> ordered;
    ordered.reserve(urls.size());
    for (const auto& entry : keyed) {
        ordered.push_back(*entry.second);
    }

    LOG_DEBUG("Scheduler ordered " + std::to_string(ordered.size()) + " URLs by priority");
    return ordered;
}
