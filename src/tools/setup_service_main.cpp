#include "ToolSupport.hpp"
#include "kdeploy/core/CommandRunner.hpp"
#include "kdeploy/core/EnvironmentProbe.hpp"
#include "kdeploy/core/Prompt.hpp"
#include "kdeploy/core/SystemView.hpp"
#include "kdeploy/platform/PlatformFactory.hpp"
#include "kdeploy/provision/DependencyProvisioner.hpp"
#include "kdeploy/service/ServiceRegistrar.hpp"

#include <filesystem>
#include <iostream>

using namespace kdeploy;

int main(int argc, char* argv[]) {
    tools::ToolInfo info{"kneeboard-setup-service", "Pilot Kneeboard - systemd service setup", {}};
    tools::ToolOptions options;

    switch (tools::parseArguments(argc, argv, info, options)) {
        case tools::ParseOutcome::ExitSuccess: return 0;
        case tools::ParseOutcome::ExitFailure: return 1;
        case tools::ParseOutcome::Run: break;
    }

    return tools::runTool([&]() {
        DeployConfig config = tools::loadConfig(options.config_path);

        tools::printBanner("Pilot Kneeboard Service Setup");
        std::cout << "This tool will set up the kneeboard application to run automatically on boot using systemd." << std::endl;
        std::cout << std::endl;

        HostSystemView system;
        EnvironmentProbe probe(system, config.board);
        DeviceProfile profile = probe.probe();

        if (!probe.confirmDevice(profile, Prompt::standard(), "Service setup")) {
            return 0;
        }

        std::cout << "Checking dependencies..." << std::endl;
        ShellCommandRunner runner;
        auto packages = makePackageManager(profile, runner, config);
        DependencyProvisioner provisioner(*packages);
        provisioner.provision(config.dependencies.run, profile);

        ServiceRegistrarSettings settings;
        settings.unit_name = config.app.service_name + ".service";
        settings.install_directory = std::filesystem::current_path();
        settings.entry_point = config.app.entry_point;
        settings.runtime = config.app.runtime;
        settings.template_file = config.service.template_file;
        settings.unit_directory = config.service.unit_directory;
        settings.active_probe_ms = config.service.active_probe_ms;

        auto services = makeServiceManager();
        ServiceRegistrar registrar(system, profile, *services, Prompt::standard(), settings);
        RegistrationResult result = registrar.registerService();

        std::cout << std::endl;
        tools::printBanner("Setup Complete");
        ServiceRegistrar::printSummary(result, settings.unit_name, std::cout);
        ServiceRegistrar::printManagementCommands(settings.unit_name);
        std::cout << std::endl;
        std::cout << "Thank you for setting up the Pilot Kneeboard Application!" << std::endl;
        std::cout << "Fly safe!" << std::endl;
        return 0;
    });
}
