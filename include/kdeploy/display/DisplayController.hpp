#pragma once

/**
 * @file DisplayController.hpp
 * @brief Panel orientation for the kiosk session
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include "kdeploy/core/DeviceProfile.hpp"
#include "kdeploy/platform/DisplayManager.hpp"

#include <optional>
#include <string>

namespace kdeploy {

struct DisplayState {
    Orientation orientation{Orientation::Normal};
    std::optional<std::string> output_id;
};

/**
 * @brief Rotates the kiosk panel for the run and puts it back afterwards
 *
 * Both directions try the board's output name first and fall back to the
 * first connected output. Nothing here throws: a missing or non-rotatable
 * display is an expected condition.
 */
class DisplayController {
public:
    DisplayController(DisplayManager& display, const DeviceProfile& profile, std::string board_output);

    DisplayResult configure();
    DisplayResult restore();

    const DisplayState& state() const { return state_; }

private:
    DisplayManager& display_;
    DeviceProfile profile_;
    std::string board_output_;
    DisplayState state_;

    DisplayResult apply(Orientation orientation);
    void log(const DisplayResult& result, Orientation orientation) const;
};

/**
 * @brief Calls restore() on scope exit
 *
 * Armed only when constructed with armed=true, so a headless run (where
 * configure() was a no-op) never restores.
 */
class ScopedDisplayRestore {
public:
    ScopedDisplayRestore(DisplayController& controller, bool armed);
    ~ScopedDisplayRestore();

    ScopedDisplayRestore(const ScopedDisplayRestore&) = delete;
    ScopedDisplayRestore& operator=(const ScopedDisplayRestore&) = delete;

    // Restores now instead of at scope exit; later calls do nothing.
    void release();

private:
    DisplayController& controller_;
    bool armed_;
};

} // namespace kdeploy
