#include "kdeploy/service/ServiceRegistrar.hpp"
#include "kdeploy/core/Errors.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>
#include <thread>

namespace kdeploy {

namespace {

constexpr std::chrono::milliseconds PROBE_INTERVAL{100};

} // namespace

ServiceRegistrar::ServiceRegistrar(const SystemView& system, const DeviceProfile& profile,
                                   ServiceManager& services, Prompt& prompt, ServiceRegistrarSettings settings)
    : system_(system), profile_(profile), services_(services), prompt_(prompt), settings_(std::move(settings)) {}

void ServiceRegistrar::checkPreconditions() const {
    if (profile_.service_manager != ServiceManagerKind::Systemd) {
        throw PreconditionError(
            std::string("No systemd found on this device (service manager: ") +
                toString(profile_.service_manager) + "). Use the desktop autostart entry instead.",
            "kneeboard-install (answer y to the autostart question)");
    }

    if (!system_.isPrivileged()) {
        throw PreconditionError("Please run this tool with sudo.", "sudo kneeboard-setup-service");
    }

    auto entry_point = settings_.install_directory / settings_.entry_point;
    if (!system_.fileExists(entry_point)) {
        throw PreconditionError(
            "Error: " + settings_.entry_point + " not found in " + settings_.install_directory.string(),
            "cd <directory containing " + settings_.entry_point + "> && sudo kneeboard-setup-service");
    }

    auto template_path = settings_.install_directory / settings_.template_file;
    if (!system_.fileExists(template_path)) {
        throw PreconditionError(
            "Error: " + settings_.template_file + " not found in " + settings_.install_directory.string(),
            "cd <directory containing " + settings_.template_file + "> && sudo kneeboard-setup-service");
    }
}

std::string ServiceRegistrar::resolveUser() const {
    auto login = system_.loginName();
    if (login && !login->empty()) {
        return *login;
    }

    auto session = system_.sessionUser();
    if (session && !session->empty()) {
        return *session;
    }

    throw PreconditionError("Cannot determine which user the service should run as",
                            "sudo -u <user> kneeboard-setup-service");
}

std::filesystem::path ServiceRegistrar::writeUnitFile(const std::string& contents) const {
    auto target = settings_.unit_directory / settings_.unit_name;
    auto staging = target;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out) {
            throw PreconditionError("Cannot write " + staging.string(),
                                    "sudo mkdir -p " + settings_.unit_directory.string());
        }
        out << contents;
        out.flush();
        if (!out) {
            throw PreconditionError("Failed writing " + staging.string(),
                                    "df -h " + settings_.unit_directory.string());
        }
    }

    // Replacing in one step keeps a half-written unit out of the manager's view
    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        throw PreconditionError("Cannot install " + target.string() + ": " + ec.message(),
                                "sudo ls -ld " + settings_.unit_directory.string());
    }

    return target;
}

RegistrationResult ServiceRegistrar::registerService() {
    checkPreconditions();

    RegistrationResult result;
    const std::string& unit = settings_.unit_name;

    std::string user = resolveUser();
    std::cout << "Setting up service to run as user: " << user << std::endl;

    ServiceTemplate unit_template = ServiceTemplate::load(settings_.install_directory / settings_.template_file);

    result.descriptor.exec_path =
        settings_.runtime + " " + (settings_.install_directory / settings_.entry_point).string();
    result.descriptor.working_directory = settings_.install_directory.string();
    result.descriptor.run_as_user = user;
    result.descriptor.autostart = true;

    result.unit_file = writeUnitFile(unit_template.render(result.descriptor));
    std::cout << "Service file installed to " << result.unit_file.string() << std::endl;

    result.reloaded = services_.reload();
    if (result.reloaded) {
        std::cout << "Systemd configuration reloaded" << std::endl;
    } else {
        std::cerr << "[ServiceRegistrar] Warning: reload failed: " << services_.lastError() << std::endl;
        std::cerr << "Run manually: sudo systemctl daemon-reload" << std::endl;
    }

    if (result.descriptor.autostart) {
        result.enabled = services_.enable(unit);
        if (result.enabled) {
            std::cout << "Service enabled to start on boot" << std::endl;
        } else {
            std::cerr << "[ServiceRegistrar] Warning: enable failed: " << services_.lastError() << std::endl;
            std::cerr << "Run manually: sudo systemctl enable " << unit << std::endl;
        }
    }

    result.start = startAndProbe();
    return result;
}

ServiceStartResult ServiceRegistrar::startAndProbe() {
    ServiceStartResult start;
    const std::string& unit = settings_.unit_name;

    if (!prompt_.confirm("Do you want to start the kneeboard service now?")) {
        std::cout << "Service will start on next boot" << std::endl;
        std::cout << "You can manually start it with: sudo systemctl start " << unit << std::endl;
        return start;
    }

    start.requested = true;
    start.started = services_.start(unit);
    if (!start.started) {
        std::cerr << "[ServiceRegistrar] Warning: start failed: " << services_.lastError() << std::endl;
        std::cerr << "Check status with: sudo systemctl status " << unit << std::endl;
        return start;
    }
    std::cout << "Service started" << std::endl;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings_.active_probe_ms);
    while (true) {
        start.state = services_.activeState(unit);
        if (start.state == "active") {
            start.active = true;
            break;
        }
        if (start.state == "failed" || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(PROBE_INTERVAL);
    }

    if (start.active) {
        std::cout << "Kneeboard service is running successfully!" << std::endl;
    } else {
        std::cerr << "Warning: Service may not have started correctly"
                  << (start.state.empty() ? "" : " (state: " + start.state + ")") << "." << std::endl;
        std::cerr << "Check status with: sudo systemctl status " << unit << std::endl;
    }
    return start;
}

void ServiceRegistrar::printSummary(const RegistrationResult& result, const std::string& unit_name,
                                    std::ostream& out) {
    if (result.enabled) {
        out << "The kneeboard application will now start automatically on boot." << std::endl;
    } else {
        out << "The service is installed but NOT enabled, it will not start on boot yet." << std::endl;
        out << "Enable it with: sudo systemctl enable " << unit_name << std::endl;
    }
}

void ServiceRegistrar::printManagementCommands(const std::string& unit_name) {
    std::cout << "You can manage the service with these commands:" << std::endl;
    std::cout << "  - Check status: sudo systemctl status " << unit_name << std::endl;
    std::cout << "  - Start service: sudo systemctl start " << unit_name << std::endl;
    std::cout << "  - Stop service: sudo systemctl stop " << unit_name << std::endl;
    std::cout << "  - Disable autostart: sudo systemctl disable " << unit_name << std::endl;
}

} // namespace kdeploy
