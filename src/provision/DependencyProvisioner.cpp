#include "kdeploy/provision/DependencyProvisioner.hpp"
#include "kdeploy/core/Errors.hpp"

#include <iostream>

namespace kdeploy {

DependencyProvisioner::DependencyProvisioner(PackageManager& packages) : packages_(packages) {}

ProvisionReport DependencyProvisioner::provision(const DependencySet& dependencies, const DeviceProfile& profile) {
    ProvisionReport report;
    std::vector<Dependency> applicable;

    for (const auto& dep : dependencies) {
        if (dep.appliesTo(profile)) {
            applicable.push_back(dep);
        } else {
            report.skipped.push_back(dep.name);
        }
    }

    std::cout << "[Provisioner] Checking " << applicable.size() << " dependencies..." << std::endl;

    if (packages_.installsAsBatch()) {
        provisionBatch(applicable, report);
    } else {
        provisionSequential(applicable, report);
    }

    std::cout << "[Provisioner] " << report.already_satisfied.size() << " already present, "
              << report.installed.size() << " installed, "
              << report.warnings.size() << " optional missing" << std::endl;

    return report;
}

void DependencyProvisioner::provisionSequential(const std::vector<Dependency>& applicable, ProvisionReport& report) {
    for (const auto& dep : applicable) {
        if (packages_.isInstalled(dep)) {
            report.already_satisfied.push_back(dep.name);
            continue;
        }

        std::cout << "[Provisioner] " << dep.name << " is not installed" << std::endl;
        report.install_invocations++;
        packages_.install({dep});

        // The install exit status is advisory; only the re-check decides
        if (packages_.isInstalled(dep)) {
            report.installed.push_back(dep.name);
        } else {
            recordUnmet(dep, report);
        }
    }
}

void DependencyProvisioner::provisionBatch(const std::vector<Dependency>& applicable, ProvisionReport& report) {
    std::vector<Dependency> missing;

    for (const auto& dep : applicable) {
        if (packages_.isInstalled(dep)) {
            report.already_satisfied.push_back(dep.name);
        } else {
            std::cout << "[Provisioner] " << dep.name << " is not installed" << std::endl;
            missing.push_back(dep);
        }
    }

    if (missing.empty()) {
        return;
    }

    report.install_invocations++;
    packages_.install(missing);

    for (const auto& dep : missing) {
        if (packages_.isInstalled(dep)) {
            report.installed.push_back(dep.name);
        } else {
            recordUnmet(dep, report);
        }
    }
}

void DependencyProvisioner::recordUnmet(const Dependency& dependency, ProvisionReport& report) {
    std::string remediation = packages_.remediation(dependency);

    if (dependency.required) {
        throw DependencyError(dependency.name, remediation);
    }

    std::cerr << "[Provisioner] Warning: optional dependency " << dependency.name
              << " is still missing. Install it manually with: " << remediation << std::endl;
    report.warnings.push_back(dependency.name);
}

} // namespace kdeploy
