#include "kdeploy/platform/PackageManager.hpp"

#include <iostream>

namespace kdeploy {

// ============================================================================
// AptPackageManager
// ============================================================================

AptPackageManager::AptPackageManager(CommandRunner& runner, std::string refresh_command)
    : runner_(runner), refresh_command_(std::move(refresh_command)) {}

bool AptPackageManager::isInstalled(const Dependency& dependency) {
    return runner_.run(dependency.check_command, CommandOutput::Silence) == 0;
}

bool AptPackageManager::install(const std::vector<Dependency>& missing) {
    // Package lists are refreshed once, and only if something is missing
    if (!refreshed_ && !refresh_command_.empty() && !missing.empty()) {
        std::cout << "Updating package lists..." << std::endl;
        if (runner_.run(refresh_command_, CommandOutput::Inherit) != 0) {
            std::cerr << "[PackageManager] Warning: '" << refresh_command_
                      << "' failed, installing from cached package lists" << std::endl;
        }
        refreshed_ = true;
    }

    bool all_ok = true;
    for (const auto& dep : missing) {
        std::cout << "Installing " << dep.name << "..." << std::endl;
        int status = runner_.run(dep.install_command, CommandOutput::Inherit);
        if (status != 0) {
            std::cerr << "[PackageManager] '" << dep.install_command
                      << "' exited with status " << status << std::endl;
            all_ok = false;
        }
    }
    return all_ok;
}

std::string AptPackageManager::remediation(const Dependency& dependency) const {
    return dependency.install_command;
}

// ============================================================================
// ManifestPackageManager
// ============================================================================

ManifestPackageManager::ManifestPackageManager(CommandRunner& runner, std::string manifest_install_command)
    : runner_(runner), manifest_install_command_(std::move(manifest_install_command)) {}

bool ManifestPackageManager::isInstalled(const Dependency& dependency) {
    return runner_.run(dependency.check_command, CommandOutput::Silence) == 0;
}

bool ManifestPackageManager::install(const std::vector<Dependency>& missing) {
    if (missing.empty()) {
        return true;
    }

    std::cout << "Installing " << missing.size() << " missing component(s) from the manifest..." << std::endl;
    int status = runner_.run(manifest_install_command_, CommandOutput::Inherit);
    if (status != 0) {
        std::cerr << "[PackageManager] '" << manifest_install_command_
                  << "' exited with status " << status << std::endl;
        return false;
    }
    return true;
}

std::string ManifestPackageManager::remediation(const Dependency&) const {
    return manifest_install_command_;
}

} // namespace kdeploy
