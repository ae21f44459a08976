#include "kdeploy/platform/CrtcChange.hpp"

namespace kdeploy {

CrtcChangeOutcome runCrtcChange(const CrtcChangeSteps& steps) {
    if (!steps.disable()) {
        return CrtcChangeOutcome::Rejected;
    }

    steps.resize();
    if (steps.apply()) {
        return CrtcChangeOutcome::Applied;
    }

    return steps.revert() ? CrtcChangeOutcome::RolledBack : CrtcChangeOutcome::RollbackFailed;
}

const char* toString(CrtcChangeOutcome outcome) {
    switch (outcome) {
        case CrtcChangeOutcome::Applied: return "applied";
        case CrtcChangeOutcome::Rejected: return "rejected";
        case CrtcChangeOutcome::RolledBack: return "rolled back";
        case CrtcChangeOutcome::RollbackFailed: return "rollback failed";
    }
    return "unknown";
}

} // namespace kdeploy
