#pragma once

#include <string>
#include <chrono>

namespace linkguard::common {

// ISO-8601 UTC with second precision, e.g. "2025-03-01T12:00:05Z"
std::string isoUtc(std::chrono::system_clock::time_point time);

inline std::string isoUtcNow() {
    return isoUtc(std::chrono::system_clock::now());
}

} // namespace linkguard::common
