/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: clock.h

    Description:
        Wall-clock source used for every persisted timestamp (heartbeats,
        checkpoint creation, signal snapshots). Components take a Clock in
        their config so tests can drive time explicitly.

        All timestamps are milliseconds since the Unix epoch. Heartbeat
        records are written by one process and read by another, so a
        process-local steady clock cannot be used for them.
*******************************************************************************/

#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace fleetwatch {

using Clock = std::function<int64_t()>;

inline int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline Clock system_clock() {
    return &wall_clock_ms;
}

/**
 * @brief Formats an epoch-ms timestamp as ISO-8601 UTC
 *        ("2026-10-19T14:03:11.482Z").
 */
std::string format_iso8601(int64_t epoch_ms);

} // namespace fleetwatch

#endif // CLOCK_H
