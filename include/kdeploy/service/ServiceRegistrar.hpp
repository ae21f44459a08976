#pragma once

/**
 * @file ServiceRegistrar.hpp
 * @brief Boot-time service registration
 *
 * Renders the unit template for this device and hands it to the service
 * manager.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include "kdeploy/core/DeviceProfile.hpp"
#include "kdeploy/core/Prompt.hpp"
#include "kdeploy/core/SystemView.hpp"
#include "kdeploy/platform/ServiceManager.hpp"
#include "kdeploy/service/ServiceTemplate.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace kdeploy {

struct ServiceRegistrarSettings {
    std::string unit_name{"kneeboard.service"};
    std::filesystem::path install_directory;     // absolute
    std::string entry_point{"kneeboard_gui.py"};
    std::string runtime{"/usr/bin/python3"};
    std::string template_file{"kneeboard.service"};
    std::filesystem::path unit_directory{"/etc/systemd/system"};
    int active_probe_ms{1000};
};

struct ServiceStartResult {
    bool requested{false};      // operator answered y
    bool started{false};        // StartUnit accepted
    bool active{false};         // reached "active" before the probe deadline
    std::string state;          // last ActiveState seen
};

struct RegistrationResult {
    std::filesystem::path unit_file;
    ServiceDescriptor descriptor;
    bool reloaded{false};
    bool enabled{false};
    ServiceStartResult start;
};

/**
 * @brief Installs the kiosk app as a boot-time service
 *
 * Needs root and a systemd host; devices without systemd are sent to the
 * desktop autostart offered by the installer. Writes the rendered unit
 * file (replacing any previous one), reloads the service manager and
 * enables the unit. Starting it right away is offered interactively. Reload/enable/start failures are
 * reported with the command to run by hand but do not abort.
 */
class ServiceRegistrar {
public:
    ServiceRegistrar(const SystemView& system, const DeviceProfile& profile, ServiceManager& services,
                     Prompt& prompt, ServiceRegistrarSettings settings);

    RegistrationResult registerService();

    // Original login user, or the session user if there is no login.
    std::string resolveUser() const;

    static void printManagementCommands(const std::string& unit_name);

    // Closing summary; claims boot autostart only when the unit was enabled.
    static void printSummary(const RegistrationResult& result, const std::string& unit_name,
                             std::ostream& out);

private:
    const SystemView& system_;
    const DeviceProfile& profile_;
    ServiceManager& services_;
    Prompt& prompt_;
    ServiceRegistrarSettings settings_;

    void checkPreconditions() const;
    std::filesystem::path writeUnitFile(const std::string& contents) const;
    ServiceStartResult startAndProbe();
};

} // namespace kdeploy
