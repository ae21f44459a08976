#pragma once

/**
 * @file ProcessSpawner.hpp
 * @brief Child process execution with signal relay
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <signal.h>

#include <map>
#include <string>
#include <vector>

namespace kdeploy {

struct LaunchCommand {
    std::vector<std::string> argv;
    std::map<std::string, std::string> environment;    // added to the inherited environment
    std::string working_directory;                      // empty: inherit
};

struct ExitStatus {
    int code{0};
    int signal{0};              // non-zero if the child was killed
    bool interrupted{false};    // operator sent SIGINT/SIGTERM during the wait

    // Status the way a POSIX shell reports it
    int shellStatus() const { return signal != 0 ? 128 + signal : code; }
};

/**
 * @brief SIGINT/SIGTERM handling for the lifetime of a launch
 *
 * While a scope is alive the two signals never terminate this process:
 * they are relayed to the running child, or recorded when no child is
 * running yet. Scopes nest; the outermost one clears the recorded signal.
 */
class InterruptScope {
public:
    InterruptScope();
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    // Last signal received while no child was running, 0 if none.
    static int pendingSignal();

private:
    struct sigaction previous_int_ {};
    struct sigaction previous_term_ {};
};

class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    // Starts the command and blocks until it terminates.
    virtual ExitStatus run(const LaunchCommand& command) = 0;
};

/**
 * @brief fork/execvp with SIGINT and SIGTERM forwarded to the child
 *
 * While the child runs, the two signals are relayed to it instead of
 * terminating this process, so the caller always gets control back after
 * the wait. Throws std::system_error if the child cannot be created.
 */
class PosixProcessSpawner : public ProcessSpawner {
public:
    ExitStatus run(const LaunchCommand& command) override;
};

} // namespace kdeploy
