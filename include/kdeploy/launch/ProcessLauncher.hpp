#pragma once

/**
 * @file ProcessLauncher.hpp
 * @brief Kiosk application launch sequence
 *
 * Chooses between direct execution and a virtual framebuffer, rotates the
 * panel first and puts it back after the application exits.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include "kdeploy/core/DeviceProfile.hpp"
#include "kdeploy/display/DisplayController.hpp"
#include "kdeploy/launch/ProcessSpawner.hpp"

#include <string>
#include <vector>

namespace kdeploy {

enum class LaunchState {
    Idle,
    DisplayConfigured,
    Running,
    Exited
};

enum class LaunchStrategy {
    Direct,
    VirtualFramebuffer
};

struct LaunchSettings {
    std::vector<std::string> app_command;            // runtime + entry point
    std::vector<std::string> framebuffer_command;    // e.g. xvfb-run -a
    std::string headless_variable{"HEADLESS"};
    std::string working_directory;
};

const char* toString(LaunchState state);
const char* toString(LaunchStrategy strategy);

/**
 * @brief Runs the kiosk app in the foreground, with the panel rotated
 *
 * Idle -> DisplayConfigured -> Running -> Exited. The display restore
 * guard is armed before the blocking wait, so a crash, a non-zero exit,
 * an operator interrupt or a failed spawn all restore the panel exactly
 * once. A crashed app is reported, never restarted.
 */
class ProcessLauncher {
public:
    ProcessLauncher(DisplayController& display, ProcessSpawner& spawner,
                    const DeviceProfile& profile, LaunchSettings settings);

    static LaunchStrategy selectStrategy(const DeviceProfile& profile);

    LaunchCommand buildCommand() const;

    ExitStatus run();

    LaunchState state() const { return state_; }

private:
    DisplayController& display_;
    ProcessSpawner& spawner_;
    DeviceProfile profile_;
    LaunchSettings settings_;
    LaunchState state_{LaunchState::Idle};

    void transition(LaunchState next);
};

} // namespace kdeploy
