#pragma once

#include <string>
#include <deque>
#include <unordered_set>
#include <mutex>
#include <cstddef>

// Work queue of page URLs plus the set of URLs already dispatched to a worker.
// The queue is seeded once before the workers start; duplicates may sit in
// the queue, the visited set makes sure each distinct URL is processed once.
class URLFrontier {
public:
    URLFrontier();
    ~URLFrontier();

    // Append a URL to the queue (seeding only)
    void addURL(const std::string& url);

    // Non-blocking pop in FIFO order; empty string when drained
    std::string getNextURL();

    // Atomically check-and-insert into the visited set.
    // Returns true if the caller now owns the URL, false if it was already dispatched.
    bool tryMarkVisited(const std::string& url);

    bool isVisited(const std::string& url) const;

    // URLs still waiting in the queue
    size_t size() const;

    bool isEmpty() const;

    // Drop every queued URL; workers stop after their current page.
    // Returns the number of URLs dropped.
    size_t clearQueue();

    size_t visitedCount() const;

private:
    std::deque<std::string> queue;
    std::unordered_set<std::string> visitedURLs;

    mutable std::mutex queueMutex;
    mutable std::mutex visitedMutex;
};
