#pragma once

#include <string>

namespace kdeploy {

enum class CommandOutput {
    Inherit,    // child writes to our stdout/stderr
    Silence     // child output goes to /dev/null
};

/**
 * @brief Runs external shell commands and reports their exit status
 *
 * Every check and install command of a DependencySet goes through this
 * interface so provisioning can be exercised without touching the host.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Returns the exit code, or 128 + signal number if the command was killed.
    virtual int run(const std::string& command, CommandOutput output) = 0;
};

class ShellCommandRunner : public CommandRunner {
public:
    ShellCommandRunner() = default;
    ~ShellCommandRunner() override = default;

    int run(const std::string& command, CommandOutput output) override;
};

} // namespace kdeploy
