/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: clock.cpp
*******************************************************************************/

#include "common/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fleetwatch {

std::string format_iso8601(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    int64_t millis = epoch_ms % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm utc_tm;
    gmtime_r(&seconds, &utc_tm);

    std::stringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return ss.str();
}

} // namespace fleetwatch
