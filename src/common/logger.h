/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: logger.h

    Description:
        Thread-safe, level-filtered logger shared by every fleetwatch
        component: the store daemon, the store client, the coordination
        primitives, the signal and checkpoint engines and the supervisor.

        Core Features:
        - One static mutex serializes output lines from all threads
        - Levels DEBUG, INFO, WARNING, ERROR; messages below the current
          level return before the lock is taken
        - Millisecond timestamps for correlating events across processes
        - Header-inline methods, statics defined in logger.cpp

        Output Format:
            [2026-10-19 14:03:11.482] [WARN] Worker w-3 heartbeat timeout (31250ms)

    Typical Usage:
        #include "common/logger.h"
        using namespace fleetwatch;

        Logger::set_level(Logger::parse_level("debug"));
        Logger::info("Store server listening on port 6390");
        Logger::debug("Lock contention on lock:repo/main");
*******************************************************************************/

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace fleetwatch {

/**
 * @enum LogLevel
 * @brief Severity levels in ascending order; comparison is by value.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
private:
    static LogLevel current_level_;
    static std::mutex mutex_;

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm;
        localtime_r(&time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
        }
    }

public:
    static void set_level(LogLevel level) {
        current_level_ = level;
    }

    static LogLevel get_level() {
        return current_level_;
    }

    /**
     * @brief Parses a level name as given on the command line or in a
     *        config file ("debug", "info", "warning"/"warn", "error").
     *
     * Unrecognized names fall back to INFO.
     */
    static LogLevel parse_level(const std::string& name) {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "debug") return LogLevel::DEBUG;
        if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
        if (lowered == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    static void log(LogLevel level, const std::string& message) {
        if (level < current_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << get_timestamp() << "] "
                  << "[" << level_to_string(level) << "] "
                  << message << std::endl;
    }

    static void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    static void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    static void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    static void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }
};

} // namespace fleetwatch

#endif // LOGGER_H
