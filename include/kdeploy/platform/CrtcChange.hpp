#pragma once

/**
 * @file CrtcChange.hpp
 * @brief Disable, resize, apply sequence for a CRTC reconfiguration
 *
 * A CRTC has to be switched off before the screen can be resized around
 * its new extent. If the new configuration is then rejected, the original
 * screen size and CRTC settings are put back so the panel is never left
 * dark.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <functional>

namespace kdeploy {

enum class CrtcChangeOutcome {
    Applied,
    Rejected,       // nothing was changed
    RolledBack,     // new configuration failed, original restored
    RollbackFailed  // new configuration failed and the original could not be restored
};

struct CrtcChangeSteps {
    std::function<bool()> disable;
    std::function<void()> resize;
    std::function<bool()> apply;        // includes the round trip that surfaces X errors
    std::function<bool()> revert;       // original screen size, then original CRTC settings
};

CrtcChangeOutcome runCrtcChange(const CrtcChangeSteps& steps);

const char* toString(CrtcChangeOutcome outcome);

} // namespace kdeploy
