#pragma once

/**
 * @file DependencyProvisioner.hpp
 * @brief Check-then-install driver for dependency sets
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include "kdeploy/core/DeviceProfile.hpp"
#include "kdeploy/platform/PackageManager.hpp"
#include "kdeploy/provision/DependencySet.hpp"

#include <string>
#include <vector>

namespace kdeploy {

struct ProvisionReport {
    std::vector<std::string> already_satisfied;
    std::vector<std::string> installed;
    std::vector<std::string> skipped;       // not applicable to this profile
    std::vector<std::string> warnings;      // optional entries still failing
    int install_invocations{0};
};

/**
 * @brief Ensures every applicable dependency passes its check
 *
 * A failing entry gets exactly one install attempt followed by one
 * re-check. A required entry that still fails throws DependencyError;
 * an optional one only adds a warning. Entries that already pass cause
 * no install at all, so a second run after a successful one is a no-op.
 */
class DependencyProvisioner {
public:
    explicit DependencyProvisioner(PackageManager& packages);

    ProvisionReport provision(const DependencySet& dependencies, const DeviceProfile& profile);

private:
    PackageManager& packages_;

    void provisionSequential(const std::vector<Dependency>& applicable, ProvisionReport& report);
    void provisionBatch(const std::vector<Dependency>& applicable, ProvisionReport& report);
    void recordUnmet(const Dependency& dependency, ProvisionReport& report);
};

} // namespace kdeploy
