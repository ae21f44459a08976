#pragma once

/**
 * @file DisplayManager.hpp
 * @brief Output orientation control for the kneeboard panel
 *
 * The orchestration code only sees DisplayManager; XrandrDisplayManager
 * talks to the X server directly instead of shelling out to xrandr.
 *
 * @author Pilot Kneeboard Deployment Team
 * @version 1.0.0
 */

#include <optional>
#include <string>

namespace kdeploy {

enum class Orientation {
    Normal,
    Rotated
};

// NotApplicable and Failed are both non-fatal; they are kept apart so the
// logs show whether there was nothing to rotate or the rotation broke.
enum class DisplayOutcome {
    Applied,
    NotApplicable,
    Failed
};

struct DisplayResult {
    DisplayOutcome outcome{DisplayOutcome::NotApplicable};
    std::string output_id;
    std::string reason;

    bool applied() const { return outcome == DisplayOutcome::Applied; }
};

inline const char* toString(Orientation orientation) {
    return orientation == Orientation::Rotated ? "rotated" : "normal";
}

inline const char* toString(DisplayOutcome outcome) {
    switch (outcome) {
        case DisplayOutcome::Applied: return "applied";
        case DisplayOutcome::NotApplicable: return "not applicable";
        case DisplayOutcome::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief Adapter over the display server's output configuration
 */
class DisplayManager {
public:
    virtual ~DisplayManager() = default;

    virtual DisplayResult setOrientation(const std::string& output_id, Orientation orientation) = 0;

    // Name of the first output reporting a connected panel, if any.
    virtual std::optional<std::string> firstConnectedOutput() = 0;
};

/**
 * @brief XRandR implementation
 *
 * Opens its own connection to $DISPLAY for each call, so it works from a
 * plain terminal tool without an event loop. "Rotated" maps to the
 * configured xrandr rotation name (normal, left, right, inverted). A
 * rotation the server rejects is rolled back to the previous mode.
 */
class XrandrDisplayManager : public DisplayManager {
public:
    explicit XrandrDisplayManager(std::string rotation);
    ~XrandrDisplayManager() override = default;

    DisplayResult setOrientation(const std::string& output_id, Orientation orientation) override;
    std::optional<std::string> firstConnectedOutput() override;

    // RR_Rotate_* bit for an xrandr rotation name, 0 if unknown.
    static unsigned short rotationFromName(const std::string& name);

private:
    std::string rotation_;
};

} // namespace kdeploy
