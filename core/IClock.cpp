#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hublink {

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    const auto timeT = std::chrono::system_clock::to_time_t(time);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::stringstream ss;

    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tmBuf{};
    if (gmtime_s(&tmBuf, &timeT) == 0) {
        ss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tmBuf{};
    if (gmtime_r(&timeT, &tmBuf)) {
        ss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    }
#endif

    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string SystemClock::iso8601() const {
    return formatIso8601(now());
}

std::string FixedClock::iso8601() const {
    return formatIso8601(now());
}

} // namespace hublink
