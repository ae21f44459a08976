#pragma once

#include "kdeploy/config/ConfigParser.hpp"
#include "kdeploy/core/CommandRunner.hpp"
#include "kdeploy/core/DeviceProfile.hpp"
#include "kdeploy/platform/DisplayManager.hpp"
#include "kdeploy/platform/PackageManager.hpp"
#include "kdeploy/platform/ServiceManager.hpp"

#include <memory>

namespace kdeploy {

// Manifest installs on Windows, per-entry apt/pip commands elsewhere.
std::unique_ptr<PackageManager> makePackageManager(const DeviceProfile& profile,
                                                   CommandRunner& runner,
                                                   const DeployConfig& config);

std::unique_ptr<ServiceManager> makeServiceManager();

std::unique_ptr<DisplayManager> makeDisplayManager(const DeployConfig& config);

} // namespace kdeploy
