#include "ToolSupport.hpp"
#include "kdeploy/core/CommandRunner.hpp"
#include "kdeploy/core/EnvironmentProbe.hpp"
#include "kdeploy/core/Errors.hpp"
#include "kdeploy/core/Prompt.hpp"
#include "kdeploy/core/SystemView.hpp"
#include "kdeploy/display/DisplayController.hpp"
#include "kdeploy/launch/ProcessLauncher.hpp"
#include "kdeploy/platform/PlatformFactory.hpp"
#include "kdeploy/provision/DependencyProvisioner.hpp"

#include <filesystem>
#include <iostream>

using namespace kdeploy;

int main(int argc, char* argv[]) {
    tools::ToolInfo info{"kneeboard-run", "Pilot Kneeboard - launcher", {}};
    tools::ToolOptions options;

    switch (tools::parseArguments(argc, argv, info, options)) {
        case tools::ParseOutcome::ExitSuccess: return 0;
        case tools::ParseOutcome::ExitFailure: return 1;
        case tools::ParseOutcome::Run: break;
    }

    return tools::runTool([&]() {
        DeployConfig config = tools::loadConfig(options.config_path);

        tools::printBanner("Pilot Kneeboard Launcher");
        std::cout << "This tool will launch the Pilot Kneeboard application on your Raspberry Pi." << std::endl;
        std::cout << std::endl;

        HostSystemView system;
        EnvironmentProbe probe(system, config.board);
        DeviceProfile profile = probe.probe();

        if (!probe.confirmDevice(profile, Prompt::standard(), "Launch")) {
            return 0;
        }

        std::cout << "Checking dependencies..." << std::endl;
        ShellCommandRunner runner;
        auto packages = makePackageManager(profile, runner, config);
        const DependencySet& dependencies = profile.os_family == OsFamily::Windows
            ? config.dependencies.windows
            : config.dependencies.run;

        DependencyProvisioner provisioner(*packages);
        provisioner.provision(dependencies, profile);

        auto working_directory = std::filesystem::current_path();
        auto entry_point = working_directory / config.app.entry_point;
        if (!std::filesystem::exists(entry_point)) {
            throw PreconditionError("Error: " + config.app.entry_point + " not found in " + working_directory.string(),
                                    "cd <directory containing " + config.app.entry_point + "> && kneeboard-run");
        }
        tools::markExecutable(entry_point);

        auto display_manager = makeDisplayManager(config);
        DisplayController display(*display_manager, profile, config.board.output);

        LaunchSettings settings;
        settings.app_command = {config.app.runtime, entry_point.string()};
        settings.framebuffer_command = config.launch.framebuffer_command;
        settings.headless_variable = config.launch.headless_variable;
        settings.working_directory = working_directory.string();

        PosixProcessSpawner spawner;
        ProcessLauncher launcher(display, spawner, profile, settings);
        ExitStatus status = launcher.run();

        std::cout << "Application closed." << std::endl;
        return status.shellStatus();
    });
}
