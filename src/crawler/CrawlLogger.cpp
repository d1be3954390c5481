#include "../../include/crawler/CrawlLogger.h"
#include "../../include/Logger.h"

CrawlLogger::LogBroadcastFunction CrawlLogger::logBroadcastFunction_ = nullptr;
CrawlLogger::ProgressFunction CrawlLogger::progressFunction_ = nullptr;

void CrawlLogger::setLogBroadcastFunction(LogBroadcastFunction func) {
    logBroadcastFunction_ = std::move(func);
}

void CrawlLogger::setProgressFunction(ProgressFunction func) {
    progressFunction_ = std::move(func);
}

void CrawlLogger::broadcastLog(const std::string& message, const std::string& level) {
    if (logBroadcastFunction_) {
        logBroadcastFunction_(message, level);
    }
}

bool CrawlLogger::reportProgress(size_t processed, size_t total) {
    if (processed == 0) {
        return false;
    }
    if (processed % 100 != 0 && processed != total) {
        return false;
    }

    std::string message = "[crawl] processed " + std::to_string(processed) + "/" +
                          std::to_string(total) + " pages...";
    LOG_INFO(message);
    broadcastLog(message, "info");
    if (progressFunction_) {
        progressFunction_(processed, total);
    }
    return true;
}
