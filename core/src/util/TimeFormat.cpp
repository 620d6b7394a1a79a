#include "bracketeer/core/util/TimeFormat.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace bracketeer::core::util {

std::string FormatUtcTimestamp(model::TimePoint time) {
    const std::time_t timestamp = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &timestamp);
#else
    gmtime_r(&timestamp, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

bool ParseUtcTimestamp(const std::string& text, model::TimePoint& time) {
    std::tm utc{};
    std::istringstream input(text);
    input >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (input.fail()) {
        return false;
    }
    char suffix = '\0';
    if (input >> suffix && suffix != 'Z') {
        return false;
    }
#ifdef _WIN32
    const std::time_t timestamp = _mkgmtime(&utc);
#else
    const std::time_t timestamp = timegm(&utc);
#endif
    if (timestamp == static_cast<std::time_t>(-1)) {
        return false;
    }
    time = std::chrono::system_clock::from_time_t(timestamp);
    return true;
}

}  // namespace bracketeer::core::util
