#include "kdeploy/launch/ProcessLauncher.hpp"

#include <iostream>
#include <stdexcept>

namespace kdeploy {

const char* toString(LaunchState state) {
    switch (state) {
        case LaunchState::Idle: return "idle";
        case LaunchState::DisplayConfigured: return "display-configured";
        case LaunchState::Running: return "running";
        case LaunchState::Exited: return "exited";
    }
    return "unknown";
}

const char* toString(LaunchStrategy strategy) {
    return strategy == LaunchStrategy::VirtualFramebuffer ? "virtual framebuffer" : "direct";
}

ProcessLauncher::ProcessLauncher(DisplayController& display, ProcessSpawner& spawner,
                                 const DeviceProfile& profile, LaunchSettings settings)
    : display_(display), spawner_(spawner), profile_(profile), settings_(std::move(settings)) {}

LaunchStrategy ProcessLauncher::selectStrategy(const DeviceProfile& profile) {
    return profile.has_display_session ? LaunchStrategy::Direct : LaunchStrategy::VirtualFramebuffer;
}

LaunchCommand ProcessLauncher::buildCommand() const {
    LaunchCommand command;
    command.working_directory = settings_.working_directory;

    if (selectStrategy(profile_) == LaunchStrategy::VirtualFramebuffer) {
        command.argv = settings_.framebuffer_command;
        if (!settings_.headless_variable.empty()) {
            command.environment[settings_.headless_variable] = "1";
        }
    }

    command.argv.insert(command.argv.end(), settings_.app_command.begin(), settings_.app_command.end());
    return command;
}

void ProcessLauncher::transition(LaunchState next) {
    state_ = next;
}

ExitStatus ProcessLauncher::run() {
    if (state_ != LaunchState::Idle) {
        throw std::logic_error("ProcessLauncher::run called twice");
    }

    LaunchCommand command = buildCommand();

    // SIGINT/SIGTERM from here on are relayed or recorded, never fatal
    InterruptScope interrupts;

    display_.configure();
    transition(LaunchState::DisplayConfigured);

    // Registered before the wait: every way out of this scope restores
    ScopedDisplayRestore restore_guard(display_, profile_.has_display_session);

    if (int received = InterruptScope::pendingSignal()) {
        std::cout << "[ProcessLauncher] Interrupted before launch, not starting the application" << std::endl;
        transition(LaunchState::Exited);
        restore_guard.release();

        ExitStatus status;
        status.signal = received;
        status.interrupted = true;
        return status;
    }

    LaunchStrategy strategy = selectStrategy(profile_);
    if (strategy == LaunchStrategy::VirtualFramebuffer) {
        std::cout << "No display detected. Starting in headless mode..." << std::endl;
    } else {
        std::cout << "Starting Pilot Kneeboard..." << std::endl;
    }
    std::cout << "[ProcessLauncher] strategy=" << toString(strategy) << " command=";
    for (const auto& arg : command.argv) {
        std::cout << arg << " ";
    }
    std::cout << std::endl;

    transition(LaunchState::Running);

    ExitStatus status;
    try {
        status = spawner_.run(command);
    } catch (const std::exception&) {
        transition(LaunchState::Exited);
        throw;
    }

    transition(LaunchState::Exited);
    restore_guard.release();

    if (status.signal != 0) {
        std::cerr << "[ProcessLauncher] Application terminated by signal " << status.signal << std::endl;
    } else if (status.code != 0) {
        std::cerr << "[ProcessLauncher] Application exited with status " << status.code << std::endl;
    } else {
        std::cout << "[ProcessLauncher] Application exited normally" << std::endl;
    }
    if (status.interrupted) {
        std::cout << "[ProcessLauncher] Interrupted by operator" << std::endl;
    }

    return status;
}

} // namespace kdeploy
