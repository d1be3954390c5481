#pragma once

#include <chrono>
#include <optional>

// Samples the process's own CPU time and resident memory
class ProcessStats {
public:
    // Starts the wall clock and records the CPU time consumed so far
    ProcessStats();

    // User + system CPU time since construction over wall time, in percent.
    // Can exceed 100 on multiple cores. Empty if getrusage fails.
    std::optional<double> cpuPercent() const;

    // Current resident set size in MiB from /proc/self/statm; empty if unreadable
    static std::optional<double> residentMemoryMb();

private:
    static std::optional<double> cpuSeconds();

    std::chrono::steady_clock::time_point wallStart;
    std::optional<double> cpuStart;
};
