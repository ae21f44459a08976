#include "kdeploy/platform/PlatformFactory.hpp"

namespace kdeploy {

std::unique_ptr<PackageManager> makePackageManager(const DeviceProfile& profile,
                                                   CommandRunner& runner,
                                                   const DeployConfig& config) {
    if (profile.os_family == OsFamily::Windows) {
        return std::make_unique<ManifestPackageManager>(runner, config.dependencies.manifest_install);
    }
    return std::make_unique<AptPackageManager>(runner, config.dependencies.refresh_command);
}

std::unique_ptr<ServiceManager> makeServiceManager() {
    return std::make_unique<SystemdServiceManager>();
}

std::unique_ptr<DisplayManager> makeDisplayManager(const DeployConfig& config) {
    return std::make_unique<XrandrDisplayManager>(config.board.rotation);
}

} // namespace kdeploy
