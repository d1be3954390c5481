#include "../../include/linkguard/common/Clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace linkguard::common {

std::string isoUtc(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&timeT, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace linkguard::common
