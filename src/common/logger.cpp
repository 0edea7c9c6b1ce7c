/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: logger.cpp

    Description:
        Static member definitions for the Logger declared in logger.h.
        The default level is INFO; daemons override it from --log-level.
*******************************************************************************/

#include "common/logger.h"

namespace fleetwatch {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

} // namespace fleetwatch
