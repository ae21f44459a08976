#include "kdeploy/core/CommandRunner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kdeploy {

int ShellCommandRunner::run(const std::string& command, CommandOutput output) {
    pid_t pid = fork();

    if (pid == -1) {
        std::cerr << "[CommandRunner] Failed to fork for: " << command
                  << " (" << std::strerror(errno) << ")" << std::endl;
        return 127;
    }

    if (pid == 0) {
        if (output == CommandOutput::Silence) {
            int devnull = open("/dev/null", O_RDWR);
            if (devnull != -1) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                if (devnull > 2) {
                    close(devnull);
                }
            }
        }

        execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);

        // Only reached if exec fails
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            std::cerr << "[CommandRunner] waitpid failed for: " << command
                      << " (" << std::strerror(errno) << ")" << std::endl;
            return 127;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 127;
}

} // namespace kdeploy
