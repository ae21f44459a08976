#pragma once

/**
 * @file EnvironmentProbe.hpp
 * @brief Host detection for the deployment tools
 *
 * Detection order:
 * - platform identification (os_family)
 * - board identification metadata (is_target_board)
 * - graphical session indicator (has_display_session)
 * - service manager control utility (service_manager)
 *
 * Probing never modifies the host. Unreadable board metadata is not an
 * error: the host is then treated as "not the target board".
 */

#include "kdeploy/config/ConfigParser.hpp"
#include "kdeploy/core/DeviceProfile.hpp"
#include "kdeploy/core/Prompt.hpp"
#include "kdeploy/core/SystemView.hpp"

#include <string>

namespace kdeploy {

class EnvironmentProbe {
public:
    EnvironmentProbe(const SystemView& system, DeployConfig::BoardConfig board);

    EnvironmentProbe(const EnvironmentProbe&) = delete;
    EnvironmentProbe& operator=(const EnvironmentProbe&) = delete;

    DeviceProfile probe();

    bool boardMetadataReadable() const { return board_metadata_readable_; }

    const std::string& boardModel() const { return board_model_; }

    /**
     * @brief Ask whether to continue on a host that is not the target board
     *
     * Returns true without asking when the profile is the target board.
     * @param purpose what is about to happen, e.g. "Installation"
     */
    bool confirmDevice(const DeviceProfile& profile, Prompt& prompt, const std::string& purpose) const;

    static OsFamily classifyOs(const std::string& os_name);

private:
    const SystemView& system_;
    DeployConfig::BoardConfig board_;
    bool board_metadata_readable_{true};
    std::string board_model_;

    bool detectTargetBoard();
};

} // namespace kdeploy
