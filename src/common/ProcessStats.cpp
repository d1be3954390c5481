#include "ProcessStats.h"
#include "../../include/Logger.h"
#include <fstream>
#include <sys/resource.h>
#include <unistd.h>

ProcessStats::ProcessStats()
    : wallStart(std::chrono::steady_clock::now())
    , cpuStart(cpuSeconds()) {}

std::optional<double> ProcessStats::cpuSeconds() {
    struct rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return std::nullopt;
    }
    auto toSeconds = [](const timeval& tv) {
        return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
    };
    return toSeconds(usage.ru_utime) + toSeconds(usage.ru_stime);
}

std::optional<double> ProcessStats::cpuPercent() const {
    auto cpuNow = cpuSeconds();
    if (!cpuStart || !cpuNow) {
        return std::nullopt;
    }
    std::chrono::duration<double> wall = std::chrono::steady_clock::now() - wallStart;
    if (wall.count() <= 0.0) {
        return std::nullopt;
    }
    return (*cpuNow - *cpuStart) / wall.count() * 100.0;
}

std::optional<double> ProcessStats::residentMemoryMb() {
    std::ifstream statm("/proc/self/statm");
    if (!statm.is_open()) {
        LOG_DEBUG("/proc/self/statm not available");
        return std::nullopt;
    }

    long totalPages = 0;
    long residentPages = 0;
    if (!(statm >> totalPages >> residentPages)) {
        return std::nullopt;
    }

    long pageSize = sysconf(_SC_PAGESIZE);
    if (pageSize <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(residentPages) * static_cast<double>(pageSize) / (1024.0 * 1024.0);
}
