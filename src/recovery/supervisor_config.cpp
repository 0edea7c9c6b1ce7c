/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: supervisor_config.cpp
*******************************************************************************/

#include "recovery/supervisor_config.h"
#include "common/errors.h"
#include "common/json_util.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace fleetwatch {

static void expect(bool ok, const std::string& key, const char* type) {
    if (!ok) {
        throw InvalidArgumentError("Config key " + key + " must be " + type);
    }
}

void apply_supervisor_json(const Json::Value& json, SupervisorConfig& config) {
    if (!json.isObject()) {
        throw InvalidArgumentError("Supervisor config must be a JSON object");
    }

    auto read_string = [&json](const char* key, std::string& out) {
        if (!json.isMember(key)) return;
        expect(json[key].isString(), key, "a string");
        out = json[key].asString();
    };
    auto read_int = [&json](const char* key, int64_t& out) {
        if (!json.isMember(key)) return;
        expect(json[key].isIntegral(), key, "an integer");
        out = json[key].asInt64();
    };

    read_string("storeHost", config.store_host);
    read_string("supervisorId", config.supervisor_id);
    read_string("sessionId", config.session_id);
    read_string("chatUrl", config.chat_url);
    read_string("statePath", config.state_path);
    read_string("checkpointDir", config.checkpoint_dir);
    read_string("logLevel", config.log_level);

    int64_t value;
    if (json.isMember("storePort")) {
        read_int("storePort", value);
        expect(value > 0 && value < 65536, "storePort", "a port number");
        config.store_port = static_cast<uint16_t>(value);
    }
    if (json.isMember("processPid")) {
        read_int("processPid", value);
        config.process_pid = static_cast<pid_t>(value);
    }
    if (json.isMember("crashDetectionWindow")) {
        read_int("crashDetectionWindow", value);
        config.crash_detection_window_min = static_cast<int>(value);
    }
    if (json.isMember("heartbeatInterval")) {
        read_int("heartbeatInterval", value);
        config.heartbeat_interval_ms = static_cast<int>(value);
    }
    read_int("pollingInterval", config.polling_interval_ms);
    read_int("heartbeatTimeout", config.heartbeat_timeout_ms);
    read_int("crashedWorkerPollInterval", config.crashed_worker_poll_ms);

    if (json.isMember("autoRestart")) {
        expect(json["autoRestart"].isBool(), "autoRestart", "a boolean");
        config.auto_restart = json["autoRestart"].asBool();
    }
    if (json.isMember("restartCommand")) {
        expect(json["restartCommand"].isArray(), "restartCommand", "an array of strings");
        config.restart_command = json_to_string_list(json["restartCommand"]);
    }
}

void load_supervisor_config_file(const std::string& path, SupervisorConfig& config) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidArgumentError("Cannot read config file " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    Json::Value json;
    std::string error;
    if (!parse_json(buffer.str(), json, &error)) {
        throw InvalidArgumentError("Invalid JSON in " + path + ": " + error);
    }
    apply_supervisor_json(json, config);
}

static int64_t parse_number(const std::string& flag, const char* text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != std::string(text).size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::logic_error&) {
        throw InvalidArgumentError("Invalid value for " + flag + ": " + text);
    }
}

bool parse_supervisor_args(int argc, char* argv[], SupervisorConfig& config) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw InvalidArgumentError("--config needs a file");
            load_supervisor_config_file(argv[i + 1], config);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help") {
            return false;
        } else if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--store-host" && has_value) {
            config.store_host = argv[++i];
        } else if (arg == "--store-port" && has_value) {
            int64_t port = parse_number(arg, argv[++i]);
            if (port <= 0 || port >= 65536) throw InvalidArgumentError("Invalid port");
            config.store_port = static_cast<uint16_t>(port);
        } else if (arg == "--id" && has_value) {
            config.supervisor_id = argv[++i];
        } else if (arg == "--session" && has_value) {
            config.session_id = argv[++i];
        } else if (arg == "--pid" && has_value) {
            config.process_pid = static_cast<pid_t>(parse_number(arg, argv[++i]));
        } else if (arg == "--restart-cmd" && has_value) {
            // Whitespace separated; use the config file for arguments with spaces.
            config.restart_command.clear();
            std::istringstream words(argv[++i]);
            std::string word;
            while (words >> word) config.restart_command.push_back(word);
        } else if (arg == "--chat-url" && has_value) {
            config.chat_url = argv[++i];
        } else if (arg == "--state" && has_value) {
            config.state_path = argv[++i];
        } else if (arg == "--checkpoint-dir" && has_value) {
            config.checkpoint_dir = argv[++i];
        } else if (arg == "--poll-ms" && has_value) {
            config.polling_interval_ms = parse_number(arg, argv[++i]);
        } else if (arg == "--window-min" && has_value) {
            config.crash_detection_window_min = static_cast<int>(parse_number(arg, argv[++i]));
        } else if (arg == "--heartbeat-ms" && has_value) {
            config.heartbeat_interval_ms = static_cast<int>(parse_number(arg, argv[++i]));
        } else if (arg == "--no-auto-restart") {
            config.auto_restart = false;
        } else if (arg == "--log-level" && has_value) {
            config.log_level = argv[++i];
        } else {
            throw InvalidArgumentError("Unknown option: " + arg);
        }
    }
    return true;
}

void print_supervisor_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --config FILE        JSON config file (flags override it)\n"
              << "  --store-host HOST    Shared store host (default: localhost)\n"
              << "  --store-port PORT    Shared store port (default: 6390)\n"
              << "  --id ID              Supervisor id (default: supervisor-<pid>)\n"
              << "  --session ID         Session to supervise\n"
              << "  --pid PID            Session process to watch\n"
              << "  --restart-cmd CMD    Command that relaunches the session\n"
              << "  --chat-url URL       Chat URL passed to the restart command\n"
              << "  --state FILE         State file (default: fleetwatch-supervisor.json)\n"
              << "  --checkpoint-dir DIR Checkpoint directory (default: ./checkpoints)\n"
              << "  --poll-ms MS         Process polling interval (default: 1000)\n"
              << "  --window-min N       Recent checkpoint window (default: 5)\n"
              << "  --heartbeat-ms MS    Heartbeat interval (default: 5000)\n"
              << "  --no-auto-restart    Only report crashes\n"
              << "  --log-level LEVEL    debug | info | warning | error (default: info)\n"
              << "  --help               Show this help message\n";
}

} // namespace fleetwatch
