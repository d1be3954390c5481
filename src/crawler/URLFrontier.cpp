#include "URLFrontier.h"
#include "../../include/Logger.h"

URLFrontier::URLFrontier() {
    LOG_DEBUG("URLFrontier constructor called");
}

URLFrontier::~URLFrontier() {
    LOG_DEBUG("URLFrontier destructor called");
}

void URLFrontier::addURL(const std::string& url) {
    if (url.empty()) {
        LOG_DEBUG("URLFrontier::addURL ignoring empty URL");
        return;
    }

    std::lock_guard<std::mutex> lock(queueMutex);
    queue.push_back(url);
    LOG_TRACE("Added URL to frontier: " + url + ", queue size: " + std::to_string(queue.size()));
}

std::string URLFrontier::getNextURL() {
    std::lock_guard<std::mutex> lock(queueMutex);
    if (queue.empty()) {
        return "";
    }

    std::string url = std::move(queue.front());
    queue.pop_front();
    return url;
}

bool URLFrontier::tryMarkVisited(const std::string& url) {
    std::lock_guard<std::mutex> lock(visitedMutex);
    bool inserted = visitedURLs.insert(url).second;
    if (!inserted) {
        LOG_DEBUG("URL already dispatched, skipping: " + url);
    }
    return inserted;
}

bool URLFrontier::isVisited(const std::string& url) const {
    std::lock_guard<std::mutex> lock(visitedMutex);
    return visitedURLs.find(url) != visitedURLs.end();
}

size_t URLFrontier::size() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return queue.size();
}

bool URLFrontier::isEmpty() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return queue.empty();
}

size_t URLFrontier::clearQueue() {
    std::lock_guard<std::mutex> lock(queueMutex);
    size_t dropped = queue.size();
    queue.clear();
    return dropped;
}

size_t URLFrontier::visitedCount() const {
    std::lock_guard<std::mutex> lock(visitedMutex);
    return visitedURLs.size();
}
