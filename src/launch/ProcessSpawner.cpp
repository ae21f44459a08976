#include "kdeploy/launch/ProcessSpawner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>

namespace kdeploy {

namespace {

volatile sig_atomic_t g_child_pid = 0;
volatile sig_atomic_t g_interrupted = 0;
volatile sig_atomic_t g_pending_signal = 0;
int g_scope_depth = 0;

void forwardSignal(int signal) {
    g_interrupted = 1;
    if (g_child_pid > 0) {
        kill(static_cast<pid_t>(g_child_pid), signal);
    } else {
        g_pending_signal = signal;
    }
}

} // namespace

// ============================================================================
// InterruptScope
// ============================================================================

InterruptScope::InterruptScope() {
    if (g_scope_depth++ == 0) {
        g_pending_signal = 0;
    }

    struct sigaction action {};
    action.sa_handler = forwardSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(SIGINT, &action, &previous_int_);
    sigaction(SIGTERM, &action, &previous_term_);
}

InterruptScope::~InterruptScope() {
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
    g_child_pid = 0;
    g_scope_depth--;
}

int InterruptScope::pendingSignal() {
    return g_pending_signal;
}

// ============================================================================
// PosixProcessSpawner
// ============================================================================

ExitStatus PosixProcessSpawner::run(const LaunchCommand& command) {
    if (command.argv.empty()) {
        throw std::invalid_argument("empty launch command");
    }

    std::vector<char*> argv;
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    g_interrupted = 0;
    InterruptScope forwarding;

    pid_t pid = fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "fork failed for " + command.argv[0]);
    }

    if (pid == 0) {
        // Child: default signal dispositions so Ctrl+C reaches the app normally
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

        for (const auto& [name, value] : command.environment) {
            setenv(name.c_str(), value.c_str(), 1);
        }

        if (!command.working_directory.empty() && chdir(command.working_directory.c_str()) != 0) {
            std::cerr << "[ProcessSpawner] chdir " << command.working_directory
                      << " failed: " << std::strerror(errno) << std::endl;
            _exit(127);
        }

        execvp(argv[0], argv.data());

        std::cerr << "[ProcessSpawner] exec " << command.argv[0]
                  << " failed: " << std::strerror(errno) << std::endl;
        _exit(127);
    }

    g_child_pid = pid;

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid failed");
        }
    }

    ExitStatus result;
    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    result.interrupted = g_interrupted != 0;
    return result;
}

} // namespace kdeploy
