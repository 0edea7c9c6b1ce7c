/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: restarter.cpp
*******************************************************************************/

#include "recovery/restarter.h"
#include "common/errors.h"
#include "common/logger.h"

#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace fleetwatch {

CommandRestarter::CommandRestarter(const std::vector<std::string>& argv, int launch_delay_ms)
    : argv_(argv), launch_delay_ms_(launch_delay_ms >= 0 ? launch_delay_ms : 0) {
    if (argv_.empty()) {
        throw InvalidArgumentError("Restart command required");
    }
    require_non_blank(argv_[0], "Restart command");
}

RestartResult CommandRestarter::restart(const CrashEvent& crash, const std::string& chat_url) {
    auto started = std::chrono::steady_clock::now();
    RestartResult result;

    // Build argv before fork(); the child may only exec or _exit.
    std::vector<std::string> args = argv_;
    if (!chat_url.empty()) args.push_back(chat_url);

    std::vector<char*> c_args;
    for (auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    Logger::info("Restarting session " + crash.session_id + " with " + args[0]);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + strerror(errno);
        return result;
    }
    if (pid == 0) {
        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    if (launch_delay_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(launch_delay_ms_));
    }

    int status;
    pid_t reaped = waitpid(pid, &status, WNOHANG);
    if (reaped == pid) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        result.error = args[0] + " exited immediately with status " + std::to_string(code);
    } else {
        result.success = true;
        result.pid = pid;
    }

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

} // namespace fleetwatch
