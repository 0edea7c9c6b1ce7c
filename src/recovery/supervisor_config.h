/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: supervisor_config.h

    Description:
        Settings of the fleetwatch_supervisor daemon. Values come from
        defaults, then an optional JSON file (--config FILE), then argv
        flags, each layer overriding the one before.

        JSON File:
            {
              "storeHost": "localhost",      "storePort": 6390,
              "supervisorId": "sup-1",       "sessionId": "chat-42",
              "processPid": 12345,
              "restartCommand": ["/usr/bin/session-launcher", "--resume"],
              "chatUrl": "https://example.test/chat/42",
              "statePath": "supervisor.json", "checkpointDir": "./checkpoints",
              "pollingInterval": 1000,       "crashDetectionWindow": 5,
              "autoRestart": true,           "heartbeatInterval": 5000,
              "heartbeatTimeout": 30000,     "crashedWorkerPollInterval": 10000,
              "logLevel": "info"
            }
*******************************************************************************/

#ifndef SUPERVISOR_CONFIG_H
#define SUPERVISOR_CONFIG_H

#include <json/json.h>
#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace fleetwatch {

struct SupervisorConfig {
    std::string store_host;
    uint16_t store_port;
    std::string supervisor_id;          // empty: "supervisor-<pid>"
    std::string session_id;
    pid_t process_pid;                  // 0: no local process to watch
    std::vector<std::string> restart_command;
    std::string chat_url;
    std::string state_path;
    std::string checkpoint_dir;
    int64_t polling_interval_ms;
    int crash_detection_window_min;
    bool auto_restart;
    int heartbeat_interval_ms;
    int64_t heartbeat_timeout_ms;
    int64_t crashed_worker_poll_ms;
    std::string log_level;

    SupervisorConfig()
        : store_host("localhost"),
          store_port(6390),
          process_pid(0),
          state_path("fleetwatch-supervisor.json"),
          checkpoint_dir("./checkpoints"),
          polling_interval_ms(1000),
          crash_detection_window_min(5),
          auto_restart(true),
          heartbeat_interval_ms(5000),
          heartbeat_timeout_ms(30000),
          crashed_worker_poll_ms(10000),
          log_level("info") {}
};

/**
 * @brief Overlays the keys present in json onto config.
 * @throws InvalidArgumentError if json is not an object or a key has the
 *         wrong type
 */
void apply_supervisor_json(const Json::Value& json, SupervisorConfig& config);

/**
 * @throws InvalidArgumentError if the file is unreadable or not valid
 */
void load_supervisor_config_file(const std::string& path, SupervisorConfig& config);

/**
 * @brief "--flag value" argv parsing. --config is applied before every
 *        other flag regardless of its position.
 * @return false when --help was given
 * @throws InvalidArgumentError for unknown flags or bad values
 */
bool parse_supervisor_args(int argc, char* argv[], SupervisorConfig& config);

void print_supervisor_usage(const char* program_name);

} // namespace fleetwatch

#endif // SUPERVISOR_CONFIG_H
