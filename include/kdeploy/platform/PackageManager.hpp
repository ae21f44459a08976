#pragma once

/**
 * @file PackageManager.hpp
 * @brief Package installation backends
 *
 * apt on Linux installs one package per call and refreshes the lists once.
 * The manifest backend installs a whole batch through pip.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include "kdeploy/core/CommandRunner.hpp"
#include "kdeploy/provision/DependencySet.hpp"

#include <string>
#include <vector>

namespace kdeploy {

/**
 * @brief Adapter over the OS package manager
 *
 * installsAsBatch() tells the provisioner whether missing entries are
 * installed one at a time in declared order, or all at once by a single
 * manifest install call.
 */
class PackageManager {
public:
    virtual ~PackageManager() = default;

    virtual bool isInstalled(const Dependency& dependency) = 0;

    virtual bool install(const std::vector<Dependency>& missing) = 0;

    virtual bool installsAsBatch() const = 0;

    // Copy-pasteable command an operator can run by hand.
    virtual std::string remediation(const Dependency& dependency) const = 0;
};

// Debian/Raspberry Pi OS: apt and pip commands per entry.
class AptPackageManager : public PackageManager {
public:
    AptPackageManager(CommandRunner& runner, std::string refresh_command);
    ~AptPackageManager() override = default;

    bool isInstalled(const Dependency& dependency) override;
    bool install(const std::vector<Dependency>& missing) override;
    bool installsAsBatch() const override { return false; }
    std::string remediation(const Dependency& dependency) const override;

private:
    CommandRunner& runner_;
    std::string refresh_command_;
    bool refreshed_{false};
};

// Desktop test hosts: everything comes from one requirements manifest.
class ManifestPackageManager : public PackageManager {
public:
    ManifestPackageManager(CommandRunner& runner, std::string manifest_install_command);
    ~ManifestPackageManager() override = default;

    bool isInstalled(const Dependency& dependency) override;
    bool install(const std::vector<Dependency>& missing) override;
    bool installsAsBatch() const override { return true; }
    std::string remediation(const Dependency& dependency) const override;

private:
    CommandRunner& runner_;
    std::string manifest_install_command_;
};

} // namespace kdeploy
