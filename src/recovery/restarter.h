/*******************************************************************************
    Project: Fleetwatch - Session Fleet Coordination & Recovery Core
    Date: October 19, 2026

    File: restarter.h

    Description:
        Brings a crashed session back. Restarter is the seam the recovery
        supervisor calls; CommandRestarter launches a configured command
        with the session's chat URL appended as the last argument.

        CommandRestarter:
            fork() + execvp(). After launch_delay_ms the child must still
            be running, otherwise the restart counts as failed. Launched
            processes are not waited for; the process monitor picks up the
            new pid.
*******************************************************************************/

#ifndef RESTARTER_H
#define RESTARTER_H

#include "recovery/process_monitor.h"

#include <sys/types.h>

#include <string>
#include <vector>

namespace fleetwatch {

struct RestartResult {
    bool success;
    pid_t pid;
    std::string error;
    int64_t duration_ms;

    RestartResult() : success(false), pid(0), duration_ms(0) {}
};

class Restarter {
public:
    virtual ~Restarter() = default;

    virtual RestartResult restart(const CrashEvent& crash, const std::string& chat_url) = 0;
};

class CommandRestarter : public Restarter {
public:
    /**
     * @param argv  program followed by its fixed arguments
     * @throws InvalidArgumentError if argv is empty or the program is blank
     */
    CommandRestarter(const std::vector<std::string>& argv, int launch_delay_ms = 500);

    RestartResult restart(const CrashEvent& crash, const std::string& chat_url) override;

private:
    std::vector<std::string> argv_;
    int launch_delay_ms_;
};

} // namespace fleetwatch

#endif // RESTARTER_H
