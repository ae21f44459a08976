#include "ToolSupport.hpp"
#include "kdeploy/core/CommandRunner.hpp"
#include "kdeploy/core/EnvironmentProbe.hpp"
#include "kdeploy/core/Prompt.hpp"
#include "kdeploy/core/SystemView.hpp"
#include "kdeploy/platform/PlatformFactory.hpp"
#include "kdeploy/provision/DependencyProvisioner.hpp"
#include "kdeploy/service/AutostartEntry.hpp"

#include <filesystem>
#include <iostream>

using namespace kdeploy;

namespace {

void setupAutostart(const DeployConfig& config, const DeviceProfile& profile,
                    const SystemView& system, const std::filesystem::path& entry_point) {
    if (!profile.has_display_session && profile.service_manager == ServiceManagerKind::Systemd) {
        std::cout << "No desktop session detected; a desktop autostart entry would never run." << std::endl;
        std::cout << "Install the boot service instead:" << std::endl;
        std::cout << "  sudo kneeboard-setup-service" << std::endl;
        return;
    }

    if (profile.service_manager == ServiceManagerKind::None && !profile.has_display_session) {
        std::cerr << "Warning: neither a desktop session nor systemd is available; autostart was not configured."
                  << std::endl;
        return;
    }

    std::cout << "Setting up autostart..." << std::endl;

    std::filesystem::path directory = config.autostart.directory.empty()
        ? AutostartEntry::defaultDirectory(system)
        : tools::expandHome(config.autostart.directory, system.homeDirectory());

    AutostartEntry entry(config.app.title, config.app.comment,
                         config.app.runtime + " " + entry_point.string());
    auto written = entry.write(directory, config.autostart.file_name);

    std::cout << "Autostart configured (" << written.string() << ")." << std::endl;
    std::cout << "The kneeboard will start automatically on next boot." << std::endl;
    std::cout << "You may need to enable the desktop environment on your Raspberry Pi" << std::endl;
    std::cout << "using 'sudo raspi-config' if you haven't already done so." << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    tools::ToolInfo info{"kneeboard-install", "Pilot Kneeboard - dependency installer", {}};
    tools::ToolOptions options;

    switch (tools::parseArguments(argc, argv, info, options)) {
        case tools::ParseOutcome::ExitSuccess: return 0;
        case tools::ParseOutcome::ExitFailure: return 1;
        case tools::ParseOutcome::Run: break;
    }

    return tools::runTool([&]() {
        DeployConfig config = tools::loadConfig(options.config_path);

        tools::printBanner("Pilot Kneeboard Application Installer");
        std::cout << "This tool will install the necessary dependencies for the Pilot Kneeboard application." << std::endl;
        std::cout << "Designed for Raspberry Pi Zero W 2 with touchscreen." << std::endl;
        std::cout << std::endl;

        HostSystemView system;
        EnvironmentProbe probe(system, config.board);
        DeviceProfile profile = probe.probe();

        Prompt& prompt = Prompt::standard();
        if (!probe.confirmDevice(profile, prompt, "Installation")) {
            return 0;
        }

        ShellCommandRunner runner;
        auto packages = makePackageManager(profile, runner, config);
        const DependencySet& dependencies = profile.os_family == OsFamily::Windows
            ? config.dependencies.windows
            : config.dependencies.install;

        DependencyProvisioner provisioner(*packages);
        provisioner.provision(dependencies, profile);

        auto entry_point = std::filesystem::absolute(config.app.entry_point);
        if (std::filesystem::exists(entry_point)) {
            std::cout << "Making " << config.app.entry_point << " executable..." << std::endl;
            tools::markExecutable(entry_point);
        } else {
            std::cerr << "Warning: " << entry_point.string() << " not found; run the installer from the application directory." << std::endl;
        }

        std::cout << std::endl;
        tools::printBanner("Installation Complete");
        std::cout << std::endl;
        std::cout << "To run the application, use:" << std::endl;
        std::cout << "kneeboard-run" << std::endl;
        std::cout << std::endl;

        if (prompt.confirm("Would you like to set up the kneeboard to start automatically on boot?")) {
            setupAutostart(config, profile, system, entry_point);
        }

        std::cout << std::endl;
        std::cout << "Thank you for installing the Pilot Kneeboard Application!" << std::endl;
        std::cout << "Fly safe!" << std::endl;
        return 0;
    });
}
