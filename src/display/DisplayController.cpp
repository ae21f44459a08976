#include "kdeploy/display/DisplayController.hpp"

#include <iostream>

namespace kdeploy {

DisplayController::DisplayController(DisplayManager& display, const DeviceProfile& profile,
                                     std::string board_output)
    : display_(display), profile_(profile), board_output_(std::move(board_output)) {}

DisplayResult DisplayController::configure() {
    return apply(Orientation::Rotated);
}

DisplayResult DisplayController::restore() {
    return apply(Orientation::Normal);
}

DisplayResult DisplayController::apply(Orientation orientation) {
    if (!profile_.has_display_session) {
        DisplayResult skipped;
        skipped.outcome = DisplayOutcome::NotApplicable;
        skipped.reason = "no display session";
        return skipped;
    }

    DisplayResult result = display_.setOrientation(board_output_, orientation);
    log(result, orientation);

    if (!result.applied()) {
        auto detected = display_.firstConnectedOutput();
        if (detected && *detected != board_output_) {
            result = display_.setOrientation(*detected, orientation);
            log(result, orientation);
        }
    }

    if (result.applied()) {
        state_.orientation = orientation;
        state_.output_id = result.output_id;
    }
    return result;
}

void DisplayController::log(const DisplayResult& result, Orientation orientation) const {
    if (result.outcome == DisplayOutcome::Applied) {
        std::cout << "[DisplayController] " << result.output_id << " set to "
                  << toString(orientation) << std::endl;
        return;
    }

    std::cerr << "[DisplayController] " << toString(orientation) << " on "
              << (result.output_id.empty() ? "<none>" : result.output_id) << " "
              << toString(result.outcome);
    if (!result.reason.empty()) {
        std::cerr << ": " << result.reason;
    }
    std::cerr << std::endl;
}

// ============================================================================
// ScopedDisplayRestore
// ============================================================================

ScopedDisplayRestore::ScopedDisplayRestore(DisplayController& controller, bool armed)
    : controller_(controller), armed_(armed) {}

ScopedDisplayRestore::~ScopedDisplayRestore() {
    release();
}

void ScopedDisplayRestore::release() {
    if (!armed_) return;
    armed_ = false;
    controller_.restore();
}

} // namespace kdeploy
