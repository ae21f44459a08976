#pragma once

#include "kdeploy/core/DeviceProfile.hpp"

#include <string>
#include <vector>

namespace kdeploy {

enum class DependencyCondition {
    Always,
    HeadlessOnly    // only needed when there is no display session
};

struct Dependency {
    std::string name;
    std::string check_command;
    std::string install_command;
    bool required{true};
    DependencyCondition condition{DependencyCondition::Always};

    bool appliesTo(const DeviceProfile& profile) const {
        return condition == DependencyCondition::Always || !profile.has_display_session;
    }
};

// Applied in declared order: later entries may depend on earlier ones.
using DependencySet = std::vector<Dependency>;

} // namespace kdeploy
