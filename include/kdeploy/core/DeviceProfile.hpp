#pragma once

#include <string>

namespace kdeploy {

enum class OsFamily {
    Linux,
    Windows
};

enum class ServiceManagerKind {
    Systemd,
    None,
    DesktopAutostart
};

/**
 * @brief Probed description of the host the kiosk app is deployed on
 *
 * Built once per run by EnvironmentProbe and passed around by const
 * reference afterwards. Never written to disk.
 */
struct DeviceProfile {
    OsFamily os_family{OsFamily::Linux};
    bool is_target_board{false};
    bool has_display_session{false};
    ServiceManagerKind service_manager{ServiceManagerKind::None};
};

inline const char* toString(OsFamily family) {
    switch (family) {
        case OsFamily::Linux: return "linux";
        case OsFamily::Windows: return "windows";
    }
    return "unknown";
}

inline const char* toString(ServiceManagerKind kind) {
    switch (kind) {
        case ServiceManagerKind::Systemd: return "systemd";
        case ServiceManagerKind::None: return "none";
        case ServiceManagerKind::DesktopAutostart: return "desktop_autostart";
    }
    return "unknown";
}

} // namespace kdeploy
