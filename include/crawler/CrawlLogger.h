#pragma once
#include <string>
#include <functional>
#include <cstddef>

// Broadcast hook for crawl notices. The crawler core logs through Logger and
// additionally forwards to whatever listener the application (or a test) has
// installed. Without a listener every broadcast is log-only.
class CrawlLogger {
public:
    // (message, level)
    using LogBroadcastFunction = std::function<void(const std::string&, const std::string&)>;
    // (processed, total)
    using ProgressFunction = std::function<void(size_t, size_t)>;

    static void setLogBroadcastFunction(LogBroadcastFunction func);
    static void setProgressFunction(ProgressFunction func);

    // Forward a message to the broadcast listener (no-op if none is set)
    static void broadcastLog(const std::string& message, const std::string& level = "info");

    // Emit "[crawl] processed n/total pages..." when processed is a multiple of
    // 100 or equals total. Returns true if a notice was emitted.
    static bool reportProgress(size_t processed, size_t total);

private:
    static LogBroadcastFunction logBroadcastFunction_;
    static ProgressFunction progressFunction_;
};
